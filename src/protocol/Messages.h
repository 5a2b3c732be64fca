#pragma once

#include "room/Participant.h"
#include "room/Room.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Wire format: one JSON object per text frame, {"type": ..., "payload": {...}}.
// Outbound frames also carry "ts" (ms since epoch).
namespace nexus::protocol {

// ---- client -> server ----

struct Join {
    std::optional<std::string> name;  // absent, or trimmed + clamped
};

struct Move {
    double x;  // finite
    double y;  // finite
};

struct Rename {
    std::string name;  // non-empty, trimmed + clamped
};

struct Ping {};

struct Chat {
    std::string message;  // non-empty, sanitized
};

// Well-formed frame with a type this server does not know.
struct Unknown {
    std::string type;
};

// Known type whose payload failed validation. Dropped by the dispatcher.
struct Rejected {
    std::string type;
    std::string reason;
};

using Command = std::variant<Join, Move, Rename, Ping, Chat, Unknown, Rejected>;

struct Limits {
    std::size_t max_name_length = 32;
    std::size_t max_chat_length = 200;
};

// Empty when the frame is not a JSON object carrying a string "type";
// `error` (optional) receives the reason.
std::optional<Command> decode(std::string_view frame, const Limits& limits, std::string* error = nullptr);

std::string_view type_name(const Command& cmd);

// ---- server -> client ----

std::string welcome(const std::string& self_id, const room::Room& room);
std::string state(const std::vector<room::Participant>& participants);
std::string joined(const room::Participant& p);
std::string moved(const std::string& id, int x, int y);
std::string renamed(const std::string& id, const std::string& name);
std::string left(const std::string& id);
std::string pong();
std::string proximity(const std::string& self_id, const std::vector<std::string>& nearby);
std::string chat(const room::Participant& sender, const std::string& message, std::int64_t timestamp_ms);
std::string chat_error(const std::string& message);

// Auxiliary HTTP bodies.
std::string health_body(std::int64_t now_ms);
std::string room_body(const room::Room& room);

std::int64_t wall_clock_ms();

} // namespace nexus::protocol
