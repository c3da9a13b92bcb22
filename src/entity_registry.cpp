#include "entity_registry.hpp"
#include "components.hpp"

using namespace ecs;

std::optional<Entity> EntityRegistry::spawn(World& world, const std::string& name,
                                            const Vec3& position) {
    if (name.empty() || find(world, name)) return std::nullopt;

    auto e = world.create();
    world.add(e, LocalTransform{position, {0, 0, 0, 1}, {1, 1, 1}});
    world.add(e, WorldTransform{});
    world.add(e, EntityName{name});
    world.add(e, MotionState{});
    world.add(e, Controllable{});
    return e;
}

std::optional<Entity> EntityRegistry::find(World& world, const std::string& name) {
    std::optional<Entity> found;
    world.each<EntityName, Controllable>([&](Entity e, EntityName& n, Controllable&) {
        if (!found && n.value == name) found = e;
    });
    return found;
}

std::optional<Vec3> EntityRegistry::position(World& world, const std::string& name) {
    auto e = find(world, name);
    if (!e) return std::nullopt;
    auto* lt = world.try_get<LocalTransform>(*e);
    if (!lt) return std::nullopt;
    return lt->position;
}

bool EntityRegistry::is_moving(World& world, const std::string& name) {
    auto e = find(world, name);
    if (!e) return false;
    auto* state = world.try_get<MotionState>(*e);
    return state && state->active;
}

std::vector<std::string> EntityRegistry::names(World& world) {
    std::vector<std::string> out;
    world.each<EntityName, Controllable>([&](Entity, EntityName& n, Controllable&) {
        out.push_back(n.value);
    });
    return out;
}
