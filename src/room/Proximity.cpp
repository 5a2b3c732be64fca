#include "room/Proximity.h"

#include <cstdint>

namespace nexus::room {

bool Proximity::within(const Participant& a, const Participant& b) const noexcept {
    const std::int64_t dx = static_cast<std::int64_t>(a.x()) - b.x();
    const std::int64_t dy = static_cast<std::int64_t>(a.y()) - b.y();
    const std::int64_t r = radius_;
    return dx * dx + dy * dy <= r * r;
}

std::vector<std::string> Proximity::nearby_of(const Participant& self,
                                              const std::vector<Participant>& population) const {
    std::vector<std::string> out;
    for (const auto& other : population) {
        if (other.id() == self.id()) continue;
        if (within(self, other)) out.push_back(other.id());
    }
    return out;
}

} // namespace nexus::room
