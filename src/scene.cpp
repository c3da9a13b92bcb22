#include "scene.hpp"
#include "components.hpp"
#include "entity_registry.hpp"
#include <ecs/modules/transform.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ecs::Vec3 parse_vec3(const json& j) {
    return {j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>()};
}

static Color4 parse_color4(const json& j) {
    return {j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>(), j.at(3).get<float>()};
}

static ShapeType parse_shape(const std::string& s) {
    if (s == "Box")     return ShapeType::Box;
    if (s == "Sphere")  return ShapeType::Sphere;
    if (s == "Capsule") return ShapeType::Capsule;
    throw std::runtime_error("SceneLoader: unknown shape '" + s + "'");
}

// ---------------------------------------------------------------------------
// Entity spawning
// ---------------------------------------------------------------------------

static ecs::Entity spawn_named(ecs::World& world, const std::string& name,
                               const ecs::Vec3& pos, const ecs::Vec3& scl) {
    auto spawned = EntityRegistry::spawn(world, name, pos);
    if (!spawned) throw std::runtime_error("SceneLoader: duplicate or empty name '" + name + "'");
    if (auto* lt = world.try_get<ecs::LocalTransform>(*spawned)) lt->scale = scl;
    return *spawned;
}

static ecs::Entity spawn_static(ecs::World& world, const ecs::Vec3& pos, const ecs::Vec3& scl) {
    auto ent = world.create();
    world.add(ent, ecs::LocalTransform{pos, {0, 0, 0, 1}, scl});
    world.add(ent, ecs::WorldTransform{});
    return ent;
}

static void spawn_entity(ecs::World& world, const json& e) {
    ecs::Vec3 pos = {0, 0, 0};
    ecs::Vec3 scl = {1, 1, 1};
    if (e.contains("transform")) {
        const auto& t = e["transform"];
        if (t.contains("position")) pos = parse_vec3(t["position"]);
        if (t.contains("scale"))    scl = parse_vec3(t["scale"]);
    }

    // 1. Identity + transform. Controllable entities go through the registry
    //    so they get the full motion component set.
    auto ent = e.contains("name") ? spawn_named(world, e["name"].get<std::string>(), pos, scl)
                                  : spawn_static(world, pos, scl);

    // 2. Visual representation
    if (e.contains("mesh")) {
        const auto& m = e["mesh"];
        ShapeType shape        = parse_shape(m.value("shape", std::string("Box")));
        Color4    color        = m.contains("color")        ? parse_color4(m["color"])      : Colors::White;
        ecs::Vec3 scale_offset = m.contains("scale_offset") ? parse_vec3(m["scale_offset"]) : ecs::Vec3{1,1,1};
        world.add(ent, MeshRenderer{shape, color, scale_offset});
    }

    // 3. Tags
    if (e.contains("tags")) {
        for (const auto& tag : e["tags"]) {
            if (tag.get<std::string>() == "World") world.add(ent, WorldTag{});
        }
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool SceneLoader::load_from_string(ecs::World& world, const std::string& json_str) {
    try {
        json scene = json::parse(json_str);
        for (const auto& entity_json : scene.at("entities")) {
            spawn_entity(world, entity_json);
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return false;
    }
}

bool SceneLoader::load(ecs::World& world, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("SceneLoader: cannot open '{}'", path);
        return false;
    }
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(world, content);
}

void SceneLoader::unload(ecs::World& world) {
    std::vector<ecs::Entity> to_destroy;
    world.each<WorldTag>([&](ecs::Entity e, WorldTag&) { to_destroy.push_back(e); });
    for (auto e : to_destroy) world.destroy(e);
    world.deferred().flush(world);
}
