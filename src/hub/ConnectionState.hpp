#pragma once

#include "networking/Transport.h"
#include "room/RateLimiter.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace nexus::hub {

// Everything the hub tracks per open connection.
struct ConnectionState {
    using Clock = std::chrono::steady_clock;

    ConnectionState(networking::ClientId client_id,
                    std::string participant_id,
                    Clock::duration move_interval,
                    Clock::duration chat_interval)
        : client_id(client_id),
          participant_id(std::move(participant_id)),
          move_gate(move_interval),
          chat_gate(chat_interval) {}

    networking::ClientId client_id;
    std::string participant_id;  // "p-<ulid>"

    // Cleared by each heartbeat probe, set again by any inbound traffic.
    bool alive = true;

    room::RateLimiter move_gate;
    room::RateLimiter chat_gate;
};

} // namespace nexus::hub
