#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>

namespace nexus::hub {

class Hub;

// Periodic liveness round + TTL sweep, rescheduled on one timer until stop().
class HeartbeatMonitor {
public:
    HeartbeatMonitor(boost::asio::io_context& ioc, Hub& hub, std::chrono::milliseconds interval);

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    void start();
    void stop();

    // One cycle, exposed for tests and for start()'s timer.
    void run_once();

    std::size_t cycles() const noexcept { return cycles_; }

private:
    void schedule();

    Hub& hub_;
    std::chrono::milliseconds interval_;
    boost::asio::steady_timer timer_;
    std::atomic<bool> running_{false};
    std::size_t cycles_ = 0;
};

} // namespace nexus::hub
