#include "hub/Hub.h"

#include "common/Log.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace nexus::hub {

namespace {
constexpr std::string_view kTag = "hub";
constexpr const char* kNoOneNearby = "No one nearby to chat with";
} // namespace

// Exhaustive over protocol::Command: adding a message type without a case
// here fails to compile.
struct Hub::Dispatch {
    Hub& hub;
    ConnectionState& conn;
    Clock::time_point now;

    void operator()(const protocol::Join& cmd) const { hub.handle(conn, cmd); }
    void operator()(const protocol::Move& cmd) const { hub.handle(conn, cmd, now); }
    void operator()(const protocol::Rename& cmd) const { hub.handle(conn, cmd); }
    void operator()(const protocol::Ping& cmd) const { hub.handle(conn, cmd); }
    void operator()(const protocol::Chat& cmd) const { hub.handle(conn, cmd, now); }

    void operator()(const protocol::Unknown& cmd) const {
        log::debug(kTag, "ignoring unknown type '", cmd.type, "' from ", conn.participant_id);
    }

    void operator()(const protocol::Rejected& cmd) const {
        log::debug(kTag, "dropped ", cmd.type, " from ", conn.participant_id, ": ", cmd.reason);
    }
};

Hub::Hub(const config::Config& cfg, networking::Transport& transport)
    : cfg_(cfg),
      limits_{cfg.max_name_length, cfg.max_chat_length},
      transport_(transport),
      registry_(room::Room{cfg.room_width, cfg.room_height}, cfg.max_name_length),
      proximity_(cfg.proximity_radius),
      broadcaster_(transport) {}

Hub::Hub(const config::Config& cfg, networking::Transport& transport, std::uint64_t seed)
    : cfg_(cfg),
      limits_{cfg.max_name_length, cfg.max_chat_length},
      transport_(transport),
      ids_(seed),
      registry_(room::Room{cfg.room_width, cfg.room_height}, cfg.max_name_length, seed),
      proximity_(cfg.proximity_radius),
      broadcaster_(transport) {}

std::string Hub::on_connect(ClientId client, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);

    // A client id the transport reuses while we still hold it is a stale entry.
    if (connections_.count(client)) close_locked(client, "replaced", false);

    const std::string pid = ids_.participant_id();
    auto participant = registry_.add(pid, now);
    if (!participant) {
        // Ids are never reissued, so this only happens on a generator fault.
        log::error(kTag, "could not register ", pid, " for client ", client);
        transport_.terminate(client);
        return {};
    }

    connections_.emplace(client, ConnectionState{client, pid, cfg_.move_rate_limit, cfg_.chat_rate_limit});

    broadcaster_.send(client, protocol::welcome(pid, registry_.room()));
    broadcaster_.send(client, protocol::state(registry_.snapshot()));
    broadcaster_.broadcast(protocol::joined(*participant));
    broadcaster_.attach(client, pid);

    log::info(kTag, participant->name(), " (", pid, ") connected as client ", client,
              "; ", registry_.size(), " online");
    return pid;
}

void Hub::on_message(ClientId client, std::string_view frame, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = connections_.find(client);
    if (it == connections_.end()) return;  // closed; late frame
    ConnectionState& conn = it->second;

    conn.alive = true;
    registry_.touch(conn.participant_id, now);

    std::string error;
    auto cmd = protocol::decode(frame, limits_, &error);
    if (!cmd) {
        log::warn(kTag, "malformed frame from ", conn.participant_id, ": ", error);
        return;
    }

    std::visit(Dispatch{*this, conn, now}, *cmd);
}

void Hub::on_pong(ClientId client, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(client);
    if (it == connections_.end()) return;
    it->second.alive = true;
    registry_.touch(it->second.participant_id, now);
}

bool Hub::on_disconnect(ClientId client) {
    std::lock_guard<std::mutex> lk(mu_);
    return close_locked(client, "disconnected", false);
}

Hub::ProbeResult Hub::probe_liveness() {
    std::lock_guard<std::mutex> lk(mu_);

    ProbeResult result;
    std::vector<ClientId> dead;
    for (auto& [client, conn] : connections_) {
        if (!conn.alive) {
            dead.push_back(client);
            continue;
        }
        conn.alive = false;
        transport_.ping(client);
        ++result.probed;
    }

    for (ClientId client : dead) {
        transport_.terminate(client);
        if (close_locked(client, "missed heartbeat", true)) ++result.terminated;
    }
    return result;
}

std::size_t Hub::evict_stale(Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);

    std::size_t evicted = 0;
    for (const auto& pid : registry_.stale_since(now - cfg_.connection_ttl)) {
        if (auto client = broadcaster_.client_of(pid)) {
            transport_.terminate(*client);
            if (close_locked(*client, "ttl expired", true)) ++evicted;
            continue;
        }
        // Registry entry without a routable connection.
        if (registry_.remove(pid)) {
            log::warn(kTag, "removing ghost participant ", pid);
            broadcaster_.broadcast(protocol::left(pid));
            ++evicted;
        }
    }
    return evicted;
}

std::size_t Hub::connection_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return connections_.size();
}

std::optional<std::string> Hub::participant_of(ClientId client) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(client);
    if (it == connections_.end()) return std::nullopt;
    return it->second.participant_id;
}

void Hub::handle(ConnectionState& conn, const protocol::Join& cmd) {
    if (!cmd.name) return;

    auto p = registry_.rename(conn.participant_id, *cmd.name);
    if (!p) return;

    // The client may have sent a name we clamped; it gets the stored one back.
    broadcaster_.send(conn.client_id, protocol::state(registry_.snapshot()));
    broadcaster_.broadcast(protocol::renamed(p->id(), p->name()));
}

void Hub::handle(ConnectionState& conn, const protocol::Move& cmd, Clock::time_point now) {
    if (!conn.move_gate.try_acquire(now)) return;

    auto current = registry_.find(conn.participant_id);
    if (!current) return;

    const int x = to_coordinate(cmd.x, registry_.room().width);
    const int y = to_coordinate(cmd.y, registry_.room().height);
    if (x == current->x() && y == current->y()) return;

    auto p = registry_.update_position(conn.participant_id, x, y);
    if (!p) return;

    broadcaster_.broadcast(protocol::moved(p->id(), p->x(), p->y()), conn.client_id);
    broadcaster_.send(conn.client_id, protocol::proximity(p->id(), proximity_.nearby_of(*p, registry_.snapshot())));
}

void Hub::handle(ConnectionState& conn, const protocol::Rename& cmd) {
    auto current = registry_.find(conn.participant_id);
    if (!current || current->name() == cmd.name) return;

    auto p = registry_.rename(conn.participant_id, cmd.name);
    if (!p) return;

    broadcaster_.broadcast(protocol::renamed(p->id(), p->name()), conn.client_id);
}

void Hub::handle(ConnectionState& conn, const protocol::Ping&) {
    broadcaster_.send(conn.client_id, protocol::pong());
}

void Hub::handle(ConnectionState& conn, const protocol::Chat& cmd, Clock::time_point now) {
    if (!conn.chat_gate.try_acquire(now)) {
        log::debug(kTag, "chat rate limit exceeded for ", conn.participant_id);
        return;
    }

    auto sender = registry_.find(conn.participant_id);
    if (!sender) return;

    std::vector<std::string> audience = proximity_.nearby_of(*sender, registry_.snapshot());
    if (audience.empty()) {
        broadcaster_.send(conn.client_id, protocol::chat_error(kNoOneNearby));
        return;
    }

    audience.insert(audience.begin(), sender->id());
    const std::size_t delivered =
        broadcaster_.send_to(audience, protocol::chat(*sender, cmd.message, protocol::wall_clock_ms()));
    log::debug(kTag, "chat from ", sender->name(), " delivered to ", delivered, " connection(s)");
}

bool Hub::close_locked(ClientId client, std::string_view reason, bool evicted) {
    auto it = connections_.find(client);
    if (it == connections_.end()) return false;

    const std::string pid = it->second.participant_id;
    connections_.erase(it);
    broadcaster_.detach(client);

    if (registry_.remove(pid)) {
        broadcaster_.broadcast(protocol::left(pid));
    }

    if (evicted) {
        log::warn(kTag, "evicted ", pid, " (client ", client, "): ", reason);
    } else {
        log::info(kTag, pid, " ", reason, " (client ", client, "); ", registry_.size(), " online");
    }
    return true;
}

int Hub::to_coordinate(double v, int max) const noexcept {
    // Round half up, then clamp before the int conversion so huge values stay defined.
    const double rounded = std::floor(v + 0.5);
    return static_cast<int>(std::clamp(rounded, 0.0, static_cast<double>(max)));
}

} // namespace nexus::hub
