#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace nexus::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

namespace detail {
inline std::atomic<int> g_level{static_cast<int>(Level::Info)};
inline std::mutex g_io_mu;

inline const char* level_name(Level lv) {
    switch (lv) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
    }
    return "info";
}

template <typename... Args>
void write(Level lv, std::string_view tag, const Args&... args) {
    if (static_cast<int>(lv) < g_level.load(std::memory_order_relaxed)) return;

    std::ostringstream line;
    line << "[" << tag << "] ";
    (line << ... << args);
    line << "\n";

    std::lock_guard<std::mutex> lk(g_io_mu);
    auto& out = lv >= Level::Warn ? std::cerr : std::cout;
    out << line.str();
    out.flush();
}
} // namespace detail

inline std::optional<Level> parse_level(std::string_view s) {
    if (s == "debug") return Level::Debug;
    if (s == "info")  return Level::Info;
    if (s == "warn")  return Level::Warn;
    if (s == "error") return Level::Error;
    return std::nullopt;
}

inline void set_level(Level lv) noexcept {
    detail::g_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline Level level() noexcept {
    return static_cast<Level>(detail::g_level.load(std::memory_order_relaxed));
}

inline std::string level_name(Level lv) { return detail::level_name(lv); }

// Usage: log::info("hub", "connected ", id);
template <typename... Args> void debug(std::string_view tag, const Args&... a) { detail::write(Level::Debug, tag, a...); }
template <typename... Args> void info(std::string_view tag, const Args&... a)  { detail::write(Level::Info, tag, a...); }
template <typename... Args> void warn(std::string_view tag, const Args&... a)  { detail::write(Level::Warn, tag, a...); }
template <typename... Args> void error(std::string_view tag, const Args&... a) { detail::write(Level::Error, tag, a...); }

} // namespace nexus::log
