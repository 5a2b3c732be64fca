#include "protocol/Messages.h"

#include "common/Text.h"

#include <boost/json.hpp>

#include <chrono>
#include <cmath>
#include <cstdlib>

namespace nexus::protocol {

namespace json = boost::json;

namespace {

std::string to_std(const json::string& s) {
    return std::string(s.data(), s.size());
}

// JSON numbers, or strings holding nothing but a number.
std::optional<double> finite_number(const json::value* v) {
    if (!v) return std::nullopt;

    double d = 0;
    switch (v->kind()) {
        case json::kind::int64:  d = static_cast<double>(v->get_int64()); break;
        case json::kind::uint64: d = static_cast<double>(v->get_uint64()); break;
        case json::kind::double_: d = v->get_double(); break;
        case json::kind::string: {
            const std::string s = text::trim_copy(to_std(v->get_string()));
            if (s.empty()) return std::nullopt;
            char* end = nullptr;
            d = std::strtod(s.c_str(), &end);
            if (end != s.c_str() + s.size()) return std::nullopt;
            break;
        }
        default:
            return std::nullopt;
    }
    if (!std::isfinite(d)) return std::nullopt;
    return d;
}

std::optional<std::string> string_field(const json::object& payload, std::string_view key) {
    const json::value* v = payload.if_contains(json::string_view(key.data(), key.size()));
    if (!v || !v->is_string()) return std::nullopt;
    return to_std(v->get_string());
}

const json::value* field(const json::object& payload, std::string_view key) {
    return payload.if_contains(json::string_view(key.data(), key.size()));
}

Command decode_payload(const std::string& type, const json::object& payload, const Limits& limits) {
    if (type == "join") {
        Join cmd;
        if (auto raw = string_field(payload, "name")) {
            std::string name = text::clean_field(*raw, limits.max_name_length);
            if (!name.empty()) cmd.name = std::move(name);
        }
        return cmd;
    }
    if (type == "move") {
        auto x = finite_number(field(payload, "x"));
        auto y = finite_number(field(payload, "y"));
        if (!x || !y) return Rejected{type, "coordinates must be finite numbers"};
        return Move{*x, *y};
    }
    if (type == "rename") {
        auto raw = string_field(payload, "name");
        std::string name = raw ? text::clean_field(*raw, limits.max_name_length) : std::string{};
        if (name.empty()) return Rejected{type, "empty name"};
        return Rename{std::move(name)};
    }
    if (type == "ping") {
        return Ping{};
    }
    if (type == "chat") {
        auto raw = string_field(payload, "message");
        std::string message = raw ? text::sanitize_chat(*raw, limits.max_chat_length) : std::string{};
        if (message.empty()) return Rejected{type, "empty message"};
        return Chat{std::move(message)};
    }
    return Unknown{type};
}

json::object participant_json(const room::Participant& p) {
    return json::object{
        {"id", p.id()},
        {"name", p.name()},
        {"x", p.x()},
        {"y", p.y()},
        {"color", p.color()},
    };
}

std::string frame(std::string_view type, json::object payload) {
    json::object out{
        {"type", json::string_view(type.data(), type.size())},
        {"payload", std::move(payload)},
        {"ts", wall_clock_ms()},
    };
    return json::serialize(out);
}

json::array id_array(const std::vector<std::string>& ids) {
    json::array arr;
    arr.reserve(ids.size());
    for (const auto& id : ids) arr.emplace_back(id);
    return arr;
}

} // namespace

std::optional<Command> decode(std::string_view raw, const Limits& limits, std::string* error) {
    auto fail = [error](const char* why) -> std::optional<Command> {
        if (error) *error = why;
        return std::nullopt;
    };

    json::error_code ec;
    json::value v = json::parse(json::string_view(raw.data(), raw.size()), ec);
    if (ec) {
        if (error) *error = "invalid json: " + ec.message();
        return std::nullopt;
    }

    const json::object* obj = v.if_object();
    if (!obj) return fail("frame is not an object");

    const json::value* type = obj->if_contains("type");
    if (!type || !type->is_string()) return fail("missing type");

    static const json::object kEmpty;
    const json::value* payload = obj->if_contains("payload");
    const json::object* fields = (payload && payload->is_object()) ? &payload->get_object() : &kEmpty;

    return decode_payload(to_std(type->get_string()), *fields, limits);
}

std::string_view type_name(const Command& cmd) {
    struct Visitor {
        std::string_view operator()(const Join&) const { return "join"; }
        std::string_view operator()(const Move&) const { return "move"; }
        std::string_view operator()(const Rename&) const { return "rename"; }
        std::string_view operator()(const Ping&) const { return "ping"; }
        std::string_view operator()(const Chat&) const { return "chat"; }
        std::string_view operator()(const Unknown& u) const { return u.type; }
        std::string_view operator()(const Rejected& r) const { return r.type; }
    };
    return std::visit(Visitor{}, cmd);
}

std::string welcome(const std::string& self_id, const room::Room& room) {
    return frame("welcome", {
        {"selfId", self_id},
        {"room", json::object{{"width", room.width}, {"height", room.height}}},
    });
}

std::string state(const std::vector<room::Participant>& participants) {
    json::array arr;
    arr.reserve(participants.size());
    for (const auto& p : participants) arr.emplace_back(participant_json(p));
    return frame("state", {{"participants", std::move(arr)}});
}

std::string joined(const room::Participant& p) {
    return frame("joined", {{"participant", participant_json(p)}});
}

std::string moved(const std::string& id, int x, int y) {
    return frame("moved", {{"id", id}, {"x", x}, {"y", y}});
}

std::string renamed(const std::string& id, const std::string& name) {
    return frame("renamed", {{"id", id}, {"name", name}});
}

std::string left(const std::string& id) {
    return frame("left", {{"id", id}});
}

std::string pong() {
    return frame("pong", {});
}

std::string proximity(const std::string& self_id, const std::vector<std::string>& nearby) {
    return frame("proximity", {{"selfId", self_id}, {"nearby", id_array(nearby)}});
}

std::string chat(const room::Participant& sender, const std::string& message, std::int64_t timestamp_ms) {
    return frame("chat", {
        {"senderId", sender.id()},
        {"senderName", sender.name()},
        {"message", message},
        {"timestamp", timestamp_ms},
    });
}

std::string chat_error(const std::string& message) {
    return frame("chat_error", {{"message", message}});
}

std::string health_body(std::int64_t now_ms) {
    return json::serialize(json::object{{"ok", true}, {"time", now_ms}});
}

std::string room_body(const room::Room& room) {
    return json::serialize(json::object{{"width", room.width}, {"height", room.height}});
}

std::int64_t wall_clock_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace nexus::protocol
