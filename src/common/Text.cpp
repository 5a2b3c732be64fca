#include "common/Text.h"

namespace nexus::text {

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim_copy(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    return std::string(s.substr(start, end - start));
}

std::string clamp_utf8(std::string s, std::size_t max_bytes) {
    if (s.size() <= max_bytes) return s;

    std::size_t cut = max_bytes;
    // Continuation bytes are 10xxxxxx; step back to the lead byte.
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    s.resize(cut);
    return s;
}

std::string clean_field(std::string_view s, std::size_t max_bytes) {
    std::string out = clamp_utf8(trim_copy(s), max_bytes);
    // Clamping can expose trailing whitespace.
    return trim_copy(out);
}

std::string sanitize_chat(std::string_view s, std::size_t max_bytes) {
    const std::string clamped = clamp_utf8(trim_copy(s), max_bytes);

    std::string out;
    out.reserve(clamped.size());
    bool in_space = false;
    for (char c : clamped) {
        if (c == '<' || c == '>') continue;
        if (is_space(c)) {
            if (!in_space) out.push_back(' ');
            in_space = true;
            continue;
        }
        in_space = false;
        out.push_back(c);
    }
    return trim_copy(out);
}

} // namespace nexus::text
