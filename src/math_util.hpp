#pragma once
#include <ecs/ecs.hpp>
#include <algorithm>

namespace relay::math {

/**
 * @brief Fraction of a move completed at `now`, clamped to [0, 1].
 *
 * Clamping absorbs tick jitter: a late tick overshoots to exactly 1, an early
 * one (clock skew) never yields a negative fraction.
 */
inline double move_fraction(double start_time, double duration, double now) {
    if (duration <= 0.0) return 1.0;
    return std::clamp((now - start_time) / duration, 0.0, 1.0);
}

/**
 * @brief Linear interpolation between two points, no easing.
 */
inline ecs::Vec3 lerp(const ecs::Vec3& a, const ecs::Vec3& b, double t) {
    const float f = static_cast<float>(t);
    return {
        a.x + (b.x - a.x) * f,
        a.y + (b.y - a.y) * f,
        a.z + (b.z - a.z) * f,
    };
}

/**
 * @brief Substitutes `fallback` for absent or non-positive durations.
 */
inline double normalize_duration(double duration, double fallback) {
    return duration > 0.0 ? duration : fallback;
}

} // namespace relay::math
