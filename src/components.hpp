#pragma once
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>
#include <array>
#include <string>

// ---------------------------------------------------------------------------
// Visuals (engine-agnostic; converted to Raylib types at draw time)
// ---------------------------------------------------------------------------

enum class ShapeType { Box, Sphere, Capsule };

struct Color4 {
    float r = 1.0f, g = 1.0f, b = 1.0f, a = 1.0f;
};

namespace Colors {
    inline constexpr Color4 White  = {1.0f, 1.0f, 1.0f, 1.0f};
    inline constexpr Color4 Orange = {1.0f, 0.63f, 0.0f, 1.0f};
    inline constexpr Color4 Gray   = {0.5f, 0.5f, 0.5f, 1.0f};
}

struct MeshRenderer {
    ShapeType shape_type   = ShapeType::Box;
    Color4    color        = Colors::White;
    ecs::Vec3 scale_offset = {1, 1, 1};
};

// ---------------------------------------------------------------------------
// Entity registry
// ---------------------------------------------------------------------------

// Name the entity is addressed by on the command topic.
struct EntityName {
    std::string value;
};

// Marks an entity that accepts move commands. Spawned together with
// EntityName, ecs::LocalTransform and MotionState.
struct Controllable {};

// ---------------------------------------------------------------------------
// Motion state machine
// ---------------------------------------------------------------------------

struct ActiveMove {
    ecs::Vec3             start_position  = {0, 0, 0};
    ecs::Vec3             target_position = {0, 0, 0};
    // Target as commanded, reported back unrounded on completion.
    std::array<double, 3> target          = {0, 0, 0};
    double                start_time      = 0.0;
    double                duration        = 0.0;
    std::string           request_id;
};

// Idle when `active` is false. At most one ActiveMove exists per entity;
// begin() overwrites whatever move was running.
struct MotionState {
    bool       active = false;
    ActiveMove move;

    // Starts a move from `from`. Returns true if a running move was superseded.
    bool begin(const ecs::Vec3& from, const std::array<double, 3>& to, double now,
               double duration, std::string request_id);

    // Advances the interpolation and writes the new position into `position`.
    // Returns true while still moving; on the completing tick `position` is
    // snapped to the target and the state returns to Idle.
    bool tick(double now, ecs::Vec3& position);
};

// ---------------------------------------------------------------------------
// Time
// ---------------------------------------------------------------------------

// Scheduler time in seconds. Advanced by the pipeline each frame; tests drive
// it directly.
struct SimClock {
    double now = 0.0;
};

struct WorldTag {};
