#include "room/Participant.h"

#include <utility>

namespace nexus::room {

Participant::Participant(std::string id,
                         std::string name,
                         int x,
                         int y,
                         std::string color,
                         std::uint64_t seq,
                         Clock::time_point now)
    : id_(std::move(id)),
      name_(std::move(name)),
      color_(std::move(color)),
      x_(x),
      y_(y),
      seq_(seq),
      last_seen_(now) {}

const std::string& Participant::id() const noexcept { return id_; }
const std::string& Participant::name() const noexcept { return name_; }
const std::string& Participant::color() const noexcept { return color_; }
int Participant::x() const noexcept { return x_; }
int Participant::y() const noexcept { return y_; }
std::uint64_t Participant::seq() const noexcept { return seq_; }

void Participant::set_name(std::string new_name) {
    name_ = std::move(new_name);
}

void Participant::move_to(int x, int y) noexcept {
    x_ = x;
    y_ = y;
}

Participant::Clock::time_point Participant::last_seen() const noexcept { return last_seen_; }

void Participant::touch(Clock::time_point now) noexcept {
    last_seen_ = now;
}

} // namespace nexus::room
