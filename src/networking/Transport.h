#pragma once

#include <cstdint>
#include <string>

namespace nexus::networking {

using ClientId = std::uint64_t;

// Outbound side of a message-oriented, bidirectional connection set.
// Implementations queue work and return; they never call back into the
// caller from inside these functions, so callers may hold their own locks.
class Transport {
public:
    virtual ~Transport() = default;

    // Text frame. Unknown or closed clients are ignored.
    virtual void send(ClientId client, const std::string& frame) = 0;

    // Liveness probe; the answer comes back through the pong callback.
    virtual void ping(ClientId client) = 0;

    // Hard close. The disconnect callback follows asynchronously.
    virtual void terminate(ClientId client) = 0;
};

} // namespace nexus::networking
