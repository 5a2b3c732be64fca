#pragma once

#include "common/Log.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace nexus::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    unsigned short port = 5000;

    int room_width = 1600;
    int room_height = 900;

    std::chrono::milliseconds move_rate_limit{12};
    std::chrono::milliseconds chat_rate_limit{1000};
    std::size_t max_chat_length = 200;
    std::size_t max_name_length = 32;

    std::chrono::milliseconds heartbeat_interval{15000};
    std::chrono::milliseconds connection_ttl{30000};

    int proximity_radius = 200;

    unsigned threads = 1;
    log::Level log_level = log::Level::Info;

    // Throws ConfigError on out-of-range values.
    void validate() const;
};

// Reads `path` (YAML). Keys missing from the file keep their current value.
void apply_yaml_file(Config& cfg, const std::string& path);

// Applies PORT and NEXUS_* environment overrides.
void apply_env(Config& cfg);

// Defaults, then the YAML file (if non-empty path), then environment. Validated.
Config load(const std::string& yaml_path);

} // namespace nexus::config
