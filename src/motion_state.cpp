#include "components.hpp"
#include "math_util.hpp"
#include <utility>

bool MotionState::begin(const ecs::Vec3& from, const std::array<double, 3>& to, double now,
                        double duration, std::string request_id) {
    const bool superseded = active;
    move.start_position  = from;
    move.target_position = {static_cast<float>(to[0]), static_cast<float>(to[1]),
                            static_cast<float>(to[2])};
    move.target          = to;
    move.start_time      = now;
    move.duration        = duration;
    move.request_id      = std::move(request_id);
    active = true;
    return superseded;
}

bool MotionState::tick(double now, ecs::Vec3& position) {
    if (!active) return false;

    const double t = relay::math::move_fraction(move.start_time, move.duration, now);
    if (t >= 1.0) {
        // Snap exactly: lerp at t=1 can leave float residue.
        position = move.target_position;
        active   = false;
        return false;
    }

    position = relay::math::lerp(move.start_position, move.target_position, t);
    return true;
}
