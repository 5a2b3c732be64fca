#pragma once

#include <chrono>
#include <optional>

namespace nexus::room {

// Minimum spacing between accepted events. Rejected events are not queued and
// do not move the window.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(Clock::duration min_interval) noexcept
        : min_interval_(min_interval) {}

    bool try_acquire(Clock::time_point now) noexcept {
        if (last_ && now - *last_ < min_interval_) return false;
        last_ = now;
        return true;
    }

private:
    Clock::duration min_interval_;
    std::optional<Clock::time_point> last_;
};

} // namespace nexus::room
