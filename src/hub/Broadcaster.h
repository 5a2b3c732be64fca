#pragma once

#include "networking/Transport.h"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nexus::hub {

using networking::ClientId;

// Routing table of open connections plus the fan-out modes. Delivery is
// fire-and-forget through the transport.
class Broadcaster {
public:
    explicit Broadcaster(networking::Transport& transport);

    void attach(ClientId client, const std::string& participant_id);
    void detach(ClientId client);

    std::optional<ClientId> client_of(const std::string& participant_id) const;
    std::size_t size() const;

    void send(ClientId client, const std::string& frame);

    // Every open connection except `except`. Returns the number of recipients.
    std::size_t broadcast(const std::string& frame, std::optional<ClientId> except = std::nullopt);

    // Only connections whose participant is listed. Returns the number of recipients.
    std::size_t send_to(const std::vector<std::string>& participant_ids, const std::string& frame);

private:
    networking::Transport& transport_;

    mutable std::mutex mu_;
    std::unordered_map<ClientId, std::string> participant_by_client_;
    std::unordered_map<std::string, ClientId> client_by_participant_;
};

} // namespace nexus::hub
