#pragma once
#include <ecs/ecs.hpp>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// EntityRegistry — name → controllable entity lookups over an owned World.
//
// There is no global registry: every scheduler/ingestion instance is handed
// the World it operates on, so independent instances can coexist (tests run
// several side by side).
// ---------------------------------------------------------------------------

class EntityRegistry {
public:
    // Creates a controllable entity at `position`. Returns nullopt if the name
    // is empty or already taken.
    static std::optional<ecs::Entity> spawn(ecs::World& world, const std::string& name,
                                            const ecs::Vec3& position);

    static std::optional<ecs::Entity> find(ecs::World& world, const std::string& name);

    // Current (possibly mid-move) position of a controllable entity.
    static std::optional<ecs::Vec3> position(ecs::World& world, const std::string& name);

    static bool is_moving(ecs::World& world, const std::string& name);

    static std::vector<std::string> names(ecs::World& world);
};
