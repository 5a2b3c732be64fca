#pragma once

#include "room/Participant.h"

#include <string>
#include <vector>

namespace nexus::room {

// Radius query over the live population. A straight scan: the room holds one
// shared space, not a world.
class Proximity {
public:
    explicit Proximity(int radius) noexcept : radius_(radius) {}

    bool within(const Participant& a, const Participant& b) const noexcept;

    // Ids of everyone in `population` other than `self` within the radius,
    // in `population` order.
    std::vector<std::string> nearby_of(const Participant& self,
                                       const std::vector<Participant>& population) const;

private:
    int radius_;
};

} // namespace nexus::room
