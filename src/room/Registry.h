#pragma once

#include "room/Participant.h"
#include "room/Room.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace nexus::room {

// The one place participant state lives and changes. Every call takes the
// registry lock and hands back copies, so readers never see a half-applied
// update.
class Registry {
public:
    using Clock = Participant::Clock;

    Registry(Room room, std::size_t max_name_length);
    Registry(Room room, std::size_t max_name_length, std::uint64_t seed);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Inserts a provisional participant (guest name, random spawn and color).
    // Empty if `id` is already live. Ids are never reissued by IDGenerator,
    // so a removed id does not come back.
    std::optional<Participant> add(const std::string& id, Clock::time_point now = Clock::now());

    // Stores (x, y) clamped into the room.
    std::optional<Participant> update_position(const std::string& id, int x, int y);

    // Stores `name` trimmed and clamped; an empty result leaves the name as is.
    std::optional<Participant> rename(const std::string& id, const std::string& name);

    bool touch(const std::string& id, Clock::time_point now = Clock::now());

    // Idempotent: a second call for the same id returns empty.
    std::optional<Participant> remove(const std::string& id);

    std::optional<Participant> find(const std::string& id) const;

    // Join order.
    std::vector<Participant> snapshot() const;

    // Ids whose last activity is strictly before `cutoff`.
    std::vector<std::string> stale_since(Clock::time_point cutoff) const;

    std::size_t size() const;
    const Room& room() const noexcept { return room_; }

private:
    std::string random_color();

    const Room room_;
    const std::size_t max_name_length_;

    mutable std::mutex mu_;
    std::mt19937_64 rng_;
    std::uint64_t next_seq_ = 0;
    std::unordered_map<std::string, Participant> participants_;
};

} // namespace nexus::room
