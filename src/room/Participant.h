#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace nexus::room {

class Participant {
public:
    using Clock = std::chrono::steady_clock;

    Participant(std::string id,
                std::string name,
                int x,
                int y,
                std::string color,
                std::uint64_t seq,
                Clock::time_point now = Clock::now());

    const std::string& id() const noexcept;
    const std::string& name() const noexcept;
    const std::string& color() const noexcept;
    int x() const noexcept;
    int y() const noexcept;
    std::uint64_t seq() const noexcept;

    void set_name(std::string new_name);
    void move_to(int x, int y) noexcept;

    Clock::time_point last_seen() const noexcept;
    void touch(Clock::time_point now = Clock::now()) noexcept;

private:
    std::string id_;
    std::string name_;
    std::string color_;
    int x_;
    int y_;
    std::uint64_t seq_;
    Clock::time_point last_seen_;
};

} // namespace nexus::room
