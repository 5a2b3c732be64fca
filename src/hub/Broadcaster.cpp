#include "hub/Broadcaster.h"

#include <unordered_set>

namespace nexus::hub {

Broadcaster::Broadcaster(networking::Transport& transport) : transport_(transport) {}

void Broadcaster::attach(ClientId client, const std::string& participant_id) {
    std::lock_guard<std::mutex> lk(mu_);
    participant_by_client_[client] = participant_id;
    client_by_participant_[participant_id] = client;
}

void Broadcaster::detach(ClientId client) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = participant_by_client_.find(client);
    if (it == participant_by_client_.end()) return;
    client_by_participant_.erase(it->second);
    participant_by_client_.erase(it);
}

std::optional<ClientId> Broadcaster::client_of(const std::string& participant_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = client_by_participant_.find(participant_id);
    if (it == client_by_participant_.end()) return std::nullopt;
    return it->second;
}

std::size_t Broadcaster::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return participant_by_client_.size();
}

void Broadcaster::send(ClientId client, const std::string& frame) {
    transport_.send(client, frame);
}

std::size_t Broadcaster::broadcast(const std::string& frame, std::optional<ClientId> except) {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t sent = 0;
    for (const auto& [client, pid] : participant_by_client_) {
        if (except && client == *except) continue;
        transport_.send(client, frame);
        ++sent;
    }
    return sent;
}

std::size_t Broadcaster::send_to(const std::vector<std::string>& participant_ids, const std::string& frame) {
    std::lock_guard<std::mutex> lk(mu_);
    std::unordered_set<ClientId> seen;
    for (const auto& pid : participant_ids) {
        auto it = client_by_participant_.find(pid);
        if (it == client_by_participant_.end()) continue;
        if (!seen.insert(it->second).second) continue;
        transport_.send(it->second, frame);
    }
    return seen.size();
}

} // namespace nexus::hub
