#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace nexus::text {

bool is_space(char c) noexcept;

std::string trim_copy(std::string_view s);

// Truncates to at most `max_bytes`, backing off so a multi-byte UTF-8
// sequence is never split.
std::string clamp_utf8(std::string s, std::size_t max_bytes);

// Trim, then clamp. Empty result means "absent".
std::string clean_field(std::string_view s, std::size_t max_bytes);

// Chat text: trim, clamp, drop '<' and '>', collapse whitespace runs to one space.
std::string sanitize_chat(std::string_view s, std::size_t max_bytes);

} // namespace nexus::text
