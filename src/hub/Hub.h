#pragma once

#include "config/Config.h"
#include "hub/Broadcaster.h"
#include "hub/ConnectionState.hpp"
#include "networking/Transport.h"
#include "protocol/Messages.h"
#include "room/IDGenerator.hpp"
#include "room/Proximity.h"
#include "room/Registry.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace nexus::hub {

// Connection handler and protocol dispatcher. Every transport event for every
// connection goes through here, one at a time:
//
//   on_connect     Connecting -> Active   (welcome + state to the client, joined to others)
//   on_message     Active                 (join / move / rename / ping / chat)
//   on_disconnect  -> Closed              (registry removal + one `left`)
//
// Heartbeat steps (probe_liveness, evict_stale) run under the same lock, so a
// connection is never closed halfway through one of its own frames.
class Hub {
public:
    using Clock = std::chrono::steady_clock;

    Hub(const config::Config& cfg, networking::Transport& transport);
    // Deterministic ids, spawn points and colors. For tests.
    Hub(const config::Config& cfg, networking::Transport& transport, std::uint64_t seed);

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;

    // Returns the new participant id.
    std::string on_connect(ClientId client, Clock::time_point now = Clock::now());

    void on_message(ClientId client, std::string_view frame, Clock::time_point now = Clock::now());

    void on_pong(ClientId client, Clock::time_point now = Clock::now());

    // True when this call closed the connection; false if it was already closed.
    bool on_disconnect(ClientId client);

    struct ProbeResult {
        std::size_t terminated = 0;
        std::size_t probed = 0;
    };

    // One heartbeat round: close connections that stayed silent since the
    // previous round, probe the rest.
    ProbeResult probe_liveness();

    // Closes every participant whose last activity is older than the TTL.
    std::size_t evict_stale(Clock::time_point now = Clock::now());

    const room::Registry& registry() const noexcept { return registry_; }
    const room::Proximity& proximity() const noexcept { return proximity_; }
    const config::Config& config() const noexcept { return cfg_; }

    std::size_t connection_count() const;
    std::optional<std::string> participant_of(ClientId client) const;

private:
    struct Dispatch;

    void handle(ConnectionState& conn, const protocol::Join& cmd);
    void handle(ConnectionState& conn, const protocol::Move& cmd, Clock::time_point now);
    void handle(ConnectionState& conn, const protocol::Rename& cmd);
    void handle(ConnectionState& conn, const protocol::Ping& cmd);
    void handle(ConnectionState& conn, const protocol::Chat& cmd, Clock::time_point now);

    // Closed transition. Caller holds mu_.
    bool close_locked(ClientId client, std::string_view reason, bool evicted);

    int to_coordinate(double v, int max) const noexcept;

    const config::Config cfg_;
    const protocol::Limits limits_;
    networking::Transport& transport_;

    room::IDGenerator ids_;
    room::Registry registry_;
    room::Proximity proximity_;
    Broadcaster broadcaster_;

    mutable std::mutex mu_;
    std::unordered_map<ClientId, ConnectionState> connections_;
};

} // namespace nexus::hub
