#pragma once

#include <algorithm>

namespace nexus::room {

// Shared coordinate space. Fixed for the lifetime of the process.
struct Room {
    int width = 1600;
    int height = 900;

    int clamp_x(int x) const noexcept { return std::clamp(x, 0, width); }
    int clamp_y(int y) const noexcept { return std::clamp(y, 0, height); }

    bool contains(int x, int y) const noexcept {
        return x >= 0 && x <= width && y >= 0 && y <= height;
    }
};

} // namespace nexus::room
