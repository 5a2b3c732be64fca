#include "room/Registry.h"

#include "common/Text.h"
#include "room/IDGenerator.hpp"

#include <algorithm>

namespace nexus::room {

Registry::Registry(Room room, std::size_t max_name_length)
    : Registry(room, max_name_length, std::random_device{}()) {}

Registry::Registry(Room room, std::size_t max_name_length, std::uint64_t seed)
    : room_(room),
      max_name_length_(max_name_length),
      rng_(seed) {}

std::optional<Participant> Registry::add(const std::string& id, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    if (participants_.count(id)) return std::nullopt;

    std::uniform_int_distribution<int> dx(0, room_.width - 1);
    std::uniform_int_distribution<int> dy(0, room_.height - 1);
    const int x = dx(rng_);
    const int y = dy(rng_);

    std::string name = text::clamp_utf8("Guest-" + IDGenerator::short_tag(id), max_name_length_);
    Participant p{id, std::move(name), x, y, random_color(), next_seq_++, now};

    auto [it, inserted] = participants_.emplace(id, std::move(p));
    (void)inserted;
    return it->second;
}

std::optional<Participant> Registry::update_position(const std::string& id, int x, int y) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = participants_.find(id);
    if (it == participants_.end()) return std::nullopt;

    it->second.move_to(room_.clamp_x(x), room_.clamp_y(y));
    return it->second;
}

std::optional<Participant> Registry::rename(const std::string& id, const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = participants_.find(id);
    if (it == participants_.end()) return std::nullopt;

    std::string cleaned = text::clean_field(name, max_name_length_);
    if (!cleaned.empty()) it->second.set_name(std::move(cleaned));
    return it->second;
}

bool Registry::touch(const std::string& id, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = participants_.find(id);
    if (it == participants_.end()) return false;
    it->second.touch(now);
    return true;
}

std::optional<Participant> Registry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = participants_.find(id);
    if (it == participants_.end()) return std::nullopt;

    Participant removed = std::move(it->second);
    participants_.erase(it);
    return removed;
}

std::optional<Participant> Registry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = participants_.find(id);
    if (it == participants_.end()) return std::nullopt;
    return it->second;
}

std::vector<Participant> Registry::snapshot() const {
    std::vector<Participant> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        out.reserve(participants_.size());
        for (const auto& [id, p] : participants_) out.push_back(p);
    }
    std::sort(out.begin(), out.end(),
              [](const Participant& a, const Participant& b) { return a.seq() < b.seq(); });
    return out;
}

std::vector<std::string> Registry::stale_since(Clock::time_point cutoff) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& [id, p] : participants_) {
        if (p.last_seen() < cutoff) out.push_back(id);
    }
    return out;
}

std::size_t Registry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return participants_.size();
}

std::string Registry::random_color() {
    std::uniform_int_distribution<int> hue(0, 359);
    return "hsl(" + std::to_string(hue(rng_)) + " 90% 60%)";
}

} // namespace nexus::room
