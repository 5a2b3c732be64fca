#include "config/Config.h"

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace nexus::config {

namespace {

long long parse_integer(const std::string& key, const std::string& text) {
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || errno != 0 || end == text.c_str() || *end != '\0') {
        throw ConfigError(key + ": expected an integer, got '" + text + "'");
    }
    return v;
}

template <typename T>
T checked_cast(const std::string& key, long long v) {
    if (v < 0 || static_cast<unsigned long long>(v) > std::numeric_limits<T>::max()) {
        throw ConfigError(key + ": value " + std::to_string(v) + " out of range");
    }
    return static_cast<T>(v);
}

log::Level parse_log_level(const std::string& key, const std::string& text) {
    auto lv = log::parse_level(text);
    if (!lv) throw ConfigError(key + ": unknown log level '" + text + "'");
    return *lv;
}

template <typename Fn>
void with_env(const char* name, Fn&& fn) {
    if (const char* v = std::getenv(name)) fn(std::string(name), std::string(v));
}

template <typename Fn>
void with_node(const YAML::Node& root, const char* key, Fn&& fn) {
    if (root[key]) fn(std::string(key), root[key].as<std::string>());
}

// Shared between YAML and env so both sources accept the same spellings.
template <typename Source>
void apply_fields(Config& cfg, Source&& source, const char* const (&names)[12]) {
    source(names[0], [&](const std::string& k, const std::string& v) {
        cfg.port = checked_cast<unsigned short>(k, parse_integer(k, v));
    });
    source(names[1], [&](const std::string& k, const std::string& v) {
        cfg.room_width = checked_cast<int>(k, parse_integer(k, v));
    });
    source(names[2], [&](const std::string& k, const std::string& v) {
        cfg.room_height = checked_cast<int>(k, parse_integer(k, v));
    });
    source(names[3], [&](const std::string& k, const std::string& v) {
        cfg.move_rate_limit = std::chrono::milliseconds(checked_cast<std::uint32_t>(k, parse_integer(k, v)));
    });
    source(names[4], [&](const std::string& k, const std::string& v) {
        cfg.chat_rate_limit = std::chrono::milliseconds(checked_cast<std::uint32_t>(k, parse_integer(k, v)));
    });
    source(names[5], [&](const std::string& k, const std::string& v) {
        cfg.max_chat_length = checked_cast<std::size_t>(k, parse_integer(k, v));
    });
    source(names[6], [&](const std::string& k, const std::string& v) {
        cfg.max_name_length = checked_cast<std::size_t>(k, parse_integer(k, v));
    });
    source(names[7], [&](const std::string& k, const std::string& v) {
        cfg.heartbeat_interval = std::chrono::milliseconds(checked_cast<std::uint32_t>(k, parse_integer(k, v)));
    });
    source(names[8], [&](const std::string& k, const std::string& v) {
        cfg.connection_ttl = std::chrono::milliseconds(checked_cast<std::uint32_t>(k, parse_integer(k, v)));
    });
    source(names[9], [&](const std::string& k, const std::string& v) {
        cfg.proximity_radius = checked_cast<int>(k, parse_integer(k, v));
    });
    source(names[10], [&](const std::string& k, const std::string& v) {
        cfg.threads = checked_cast<unsigned>(k, parse_integer(k, v));
    });
    source(names[11], [&](const std::string& k, const std::string& v) {
        cfg.log_level = parse_log_level(k, v);
    });
}

constexpr const char* kYamlKeys[12] = {
    "port",
    "room_width",
    "room_height",
    "move_rate_limit_ms",
    "chat_rate_limit_ms",
    "max_chat_length",
    "max_name_length",
    "heartbeat_interval_ms",
    "connection_ttl_ms",
    "proximity_radius",
    "threads",
    "log_level",
};

constexpr const char* kEnvKeys[12] = {
    "NEXUS_PORT",
    "NEXUS_ROOM_WIDTH",
    "NEXUS_ROOM_HEIGHT",
    "NEXUS_MOVE_RATE_LIMIT_MS",
    "NEXUS_CHAT_RATE_LIMIT_MS",
    "NEXUS_MAX_CHAT_LENGTH",
    "NEXUS_MAX_NAME_LENGTH",
    "NEXUS_HEARTBEAT_INTERVAL_MS",
    "NEXUS_CONNECTION_TTL_MS",
    "NEXUS_PROXIMITY_RADIUS",
    "NEXUS_THREADS",
    "NEXUS_LOG_LEVEL",
};

} // namespace

void Config::validate() const {
    if (room_width <= 0 || room_height <= 0) throw ConfigError("room dimensions must be positive");
    if (proximity_radius < 0) throw ConfigError("proximity_radius must not be negative");
    if (max_name_length == 0) throw ConfigError("max_name_length must be positive");
    if (max_chat_length == 0) throw ConfigError("max_chat_length must be positive");
    if (heartbeat_interval.count() <= 0) throw ConfigError("heartbeat_interval_ms must be positive");
    if (connection_ttl.count() <= 0) throw ConfigError("connection_ttl_ms must be positive");
    if (threads == 0) throw ConfigError("threads must be positive");
}

void apply_yaml_file(Config& cfg, const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    if (!root.IsMap()) throw ConfigError(path + ": top level must be a mapping");

    apply_fields(cfg,
                 [&](const char* key, auto&& fn) { with_node(root, key, fn); },
                 kYamlKeys);
}

void apply_env(Config& cfg) {
    // Plain PORT is what hosting platforms set; NEXUS_PORT wins if both exist.
    with_env("PORT", [&](const std::string& k, const std::string& v) {
        cfg.port = checked_cast<unsigned short>(k, parse_integer(k, v));
    });

    apply_fields(cfg,
                 [](const char* key, auto&& fn) { with_env(key, fn); },
                 kEnvKeys);
}

Config load(const std::string& yaml_path) {
    Config cfg;
    if (!yaml_path.empty()) apply_yaml_file(cfg, yaml_path);
    apply_env(cfg);
    cfg.validate();
    return cfg;
}

} // namespace nexus::config
