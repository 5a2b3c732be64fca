#include "hub/HeartbeatMonitor.h"

#include "common/Log.hpp"
#include "hub/Hub.h"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

namespace nexus::hub {

HeartbeatMonitor::HeartbeatMonitor(boost::asio::io_context& ioc, Hub& hub, std::chrono::milliseconds interval)
    : hub_(hub),
      interval_(interval),
      timer_(boost::asio::make_strand(ioc)) {}

void HeartbeatMonitor::start() {
    if (running_.exchange(true)) return;
    schedule();
}

void HeartbeatMonitor::stop() {
    running_ = false;
    // The timer lives on its own strand; cancel there, not from the caller's thread.
    boost::asio::post(timer_.get_executor(), [this] { timer_.cancel(); });
}

void HeartbeatMonitor::run_once() {
    ++cycles_;
    const auto probe = hub_.probe_liveness();
    const auto evicted = hub_.evict_stale();

    if (probe.terminated || evicted) {
        log::warn("heartbeat", "terminated ", probe.terminated, " silent, evicted ", evicted, " stale; ",
                  hub_.connection_count(), " connection(s) left");
    } else {
        log::debug("heartbeat", "probed ", probe.probed, " connection(s)");
    }
}

void HeartbeatMonitor::schedule() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !running_) return;
        if (ec) {
            log::error("heartbeat", "timer: ", ec.message());
            return;
        }
        run_once();
        schedule();
    });
}

} // namespace nexus::hub
