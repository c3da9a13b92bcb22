#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/components.hpp"
#include "../src/config.hpp"
#include "../src/entity_registry.hpp"
#include "../src/events.hpp"
#include "../src/math_util.hpp"
#include "../src/scene.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>

// Everything here is headless: no bus, no Raylib.

using namespace relay::math;
using Catch::Matchers::WithinAbs;

static void check_vec3(const ecs::Vec3& v, float x, float y, float z) {
    CHECK_THAT(v.x, WithinAbs(x, 1e-4f));
    CHECK_THAT(v.y, WithinAbs(y, 1e-4f));
    CHECK_THAT(v.z, WithinAbs(z, 1e-4f));
}

// ---------------------------------------------------------------------------
// Math
// ---------------------------------------------------------------------------

TEST_CASE("Move fraction", "[math]") {
    SECTION("Linear inside the window") {
        CHECK_THAT(move_fraction(0.0, 4.0, 1.0), WithinAbs(0.25, 1e-9));
        CHECK_THAT(move_fraction(2.0, 4.0, 4.0), WithinAbs(0.5, 1e-9));
    }

    SECTION("Clamped at both ends") {
        CHECK(move_fraction(1.0, 2.0, 0.0) == 0.0);
        CHECK(move_fraction(0.0, 2.0, 7.5) == 1.0);
    }

    SECTION("Non-positive duration is already complete") {
        CHECK(move_fraction(0.0, 0.0, 0.0) == 1.0);
        CHECK(move_fraction(0.0, -3.0, 0.0) == 1.0);
    }
}

TEST_CASE("Lerp", "[math]") {
    ecs::Vec3 a{0, 0, 0};
    ecs::Vec3 b{10, -4, 2};
    check_vec3(lerp(a, b, 0.0), 0, 0, 0);
    check_vec3(lerp(a, b, 0.5), 5, -2, 1);
    check_vec3(lerp(a, b, 1.0), 10, -4, 2);
}

TEST_CASE("Duration normalization", "[math]") {
    CHECK(normalize_duration(3.0, 2.0) == 3.0);
    CHECK(normalize_duration(0.0, 2.0) == 2.0);
    CHECK(normalize_duration(-1.0, 2.0) == 2.0);
}

// ---------------------------------------------------------------------------
// MotionState
// ---------------------------------------------------------------------------

TEST_CASE("MotionState — idle tick is a no-op", "[motion_state]") {
    MotionState m;
    ecs::Vec3 pos{1, 2, 3};
    CHECK_FALSE(m.tick(5.0, pos));
    check_vec3(pos, 1, 2, 3);
}

TEST_CASE("MotionState — interpolates then snaps to target", "[motion_state]") {
    MotionState m;
    ecs::Vec3 pos{0, 0, 0};
    CHECK_FALSE(m.begin(pos, {0, 6, 0}, 10.0, 3.0, "r1"));
    CHECK(m.active);

    CHECK(m.tick(11.0, pos));
    check_vec3(pos, 0, 2, 0);

    CHECK(m.tick(12.5, pos));
    check_vec3(pos, 0, 5, 0);

    CHECK_FALSE(m.tick(13.2, pos));
    CHECK_FALSE(m.active);
    CHECK(pos.y == 6.0f);
}

TEST_CASE("MotionState — begin while active reports supersede", "[motion_state]") {
    MotionState m;
    ecs::Vec3 pos{0, 0, 0};
    m.begin(pos, {10, 0, 0}, 0.0, 5.0, "r1");
    m.tick(1.0, pos);

    CHECK(m.begin(pos, {1, 1, 1}, 1.0, 1.0, "r2"));
    CHECK(m.move.request_id == "r2");
    check_vec3(m.move.start_position, 2, 0, 0);
}

// ---------------------------------------------------------------------------
// EntityRegistry
// ---------------------------------------------------------------------------

TEST_CASE("EntityRegistry — spawn and lookup", "[registry]") {
    ecs::World world;
    auto cube = EntityRegistry::spawn(world, "Cube", {1, 2, 3});
    REQUIRE(cube.has_value());

    CHECK(world.has<Controllable>(*cube));
    CHECK(world.has<MotionState>(*cube));

    auto found = EntityRegistry::find(world, "Cube");
    REQUIRE(found.has_value());
    CHECK(world.try_get<EntityName>(*found)->value == "Cube");

    auto pos = EntityRegistry::position(world, "Cube");
    REQUIRE(pos.has_value());
    check_vec3(*pos, 1, 2, 3);
    CHECK_FALSE(EntityRegistry::is_moving(world, "Cube"));
}

TEST_CASE("EntityRegistry — rejects empty and duplicate names", "[registry]") {
    ecs::World world;
    REQUIRE(EntityRegistry::spawn(world, "Cube", {0, 0, 0}));
    CHECK_FALSE(EntityRegistry::spawn(world, "Cube", {5, 5, 5}));
    CHECK_FALSE(EntityRegistry::spawn(world, "", {0, 0, 0}));
    CHECK(EntityRegistry::names(world).size() == 1);
}

TEST_CASE("EntityRegistry — unknown name", "[registry]") {
    ecs::World world;
    CHECK_FALSE(EntityRegistry::find(world, "Ghost"));
    CHECK_FALSE(EntityRegistry::position(world, "Ghost"));
    CHECK_FALSE(EntityRegistry::is_moving(world, "Ghost"));
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

struct TestEvent { int value; };

TEST_CASE("Events — send and read", "[events]") {
    Events<TestEvent> queue;

    CHECK(queue.empty());
    CHECK(queue.read().empty());

    queue.send({42});
    queue.send({7});

    CHECK_FALSE(queue.empty());
    REQUIRE(queue.read().size() == 2);
    CHECK(queue.read()[0].value == 42);
    CHECK(queue.read()[1].value == 7);
}

TEST_CASE("Events — clear empties the queue", "[events]") {
    Events<TestEvent> queue;
    queue.send({1});
    queue.send({2});
    queue.clear();

    CHECK(queue.empty());
}

TEST_CASE("Events — emit without a registered queue is a no-op", "[events]") {
    ecs::World world;
    emit(world, TestEvent{1});
    CHECK(world.try_resource<Events<TestEvent>>() == nullptr);
}

TEST_CASE("Events — registry flush clears every queue", "[events]") {
    ecs::World world;
    world.set_resource(EventRegistry{});
    auto& reg = world.resource<EventRegistry>();
    reg.register_queue<TestEvent>(world);
    reg.register_queue<MoveRejectedEvent>(world);

    auto e = world.create();
    emit(world, TestEvent{3});
    emit(world, MoveRejectedEvent{e, "r9"});
    CHECK(world.resource<Events<TestEvent>>().read().size() == 1);
    CHECK(world.resource<Events<MoveRejectedEvent>>().read().size() == 1);

    reg.flush_all();
    CHECK(world.resource<Events<TestEvent>>().empty());
    CHECK(world.resource<Events<MoveRejectedEvent>>().empty());
}

// ---------------------------------------------------------------------------
// SceneLoader
// ---------------------------------------------------------------------------

static const char* MINIMAL_SCENE = R"({
  "entities": [
    {
      "transform": { "position": [1.0, 2.0, 3.0], "scale": [4.0, 5.0, 6.0] },
      "mesh": { "shape": "Box", "color": [0.5, 0.5, 0.5, 1.0] },
      "tags": ["World"]
    },
    {
      "name": "Cube",
      "transform": { "position": [0.0, 0.5, 0.0] },
      "mesh": { "shape": "Sphere" },
      "tags": ["World"]
    }
  ]
})";

TEST_CASE("SceneLoader — correct entity count", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, MINIMAL_SCENE));
    CHECK(world.count() == 2);
}

TEST_CASE("SceneLoader — named entity is controllable", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, MINIMAL_SCENE));

    auto cube = EntityRegistry::find(world, "Cube");
    REQUIRE(cube.has_value());
    auto* mesh = world.try_get<MeshRenderer>(*cube);
    REQUIRE(mesh != nullptr);
    CHECK(mesh->shape_type == ShapeType::Sphere);
    check_vec3(*EntityRegistry::position(world, "Cube"), 0, 0.5f, 0);
    CHECK(EntityRegistry::names(world).size() == 1);
}

TEST_CASE("SceneLoader — static entity has correct transform", "[scene]") {
    ecs::World world;
    SceneLoader::load_from_string(world, MINIMAL_SCENE);

    bool found = false;
    world.each<ecs::LocalTransform, MeshRenderer>([&](ecs::Entity e, ecs::LocalTransform& lt, MeshRenderer&) {
        if (world.has<Controllable>(e)) return;
        check_vec3(lt.position, 1, 2, 3);
        CHECK_THAT(lt.scale.x, WithinAbs(4.0f, 1e-4f));
        found = true;
    });
    CHECK(found);
}

TEST_CASE("SceneLoader — malformed JSON returns false", "[scene]") {
    ecs::World world;
    CHECK_FALSE(SceneLoader::load_from_string(world, "{bad json"));
    CHECK(world.count() == 0);
}

TEST_CASE("SceneLoader — duplicate names fail the load", "[scene]") {
    ecs::World world;
    CHECK_FALSE(SceneLoader::load_from_string(world, R"({"entities": [
        {"name": "Cube"}, {"name": "Cube"}
    ]})"));
}

TEST_CASE("SceneLoader — unload removes World entities", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, MINIMAL_SCENE));
    SceneLoader::unload(world);
    CHECK(world.count() == 0);
    CHECK_FALSE(EntityRegistry::find(world, "Cube"));
}

// ---------------------------------------------------------------------------
// ConfigLoader
// ---------------------------------------------------------------------------

TEST_CASE("ConfigLoader — empty object keeps defaults", "[config]") {
    RelayConfig cfg;
    REQUIRE(ConfigLoader::load_from_string("{}", cfg));
    CHECK(cfg.command_topic == "unity/commands/move");
    CHECK(cfg.feedback_topic == "unity/feedback/move_complete");
    CHECK(cfg.default_duration == 2.0);
    CHECK(cfg.feedback_producer == FeedbackProducer::Executor);
    CHECK(cfg.log_level == spdlog::level::info);
    CHECK(cfg.script.empty());
}

TEST_CASE("ConfigLoader — reads every field", "[config]") {
    RelayConfig cfg;
    REQUIRE(ConfigLoader::load_from_string(R"({
        "command_topic": "cmd",
        "feedback_topic": "fb",
        "default_duration": 0.5,
        "feedback_producer": "broker",
        "scene": "s.json",
        "log_level": "error",
        "tick_rate": 30,
        "request_timeout": 4.0,
        "headless": true,
        "headless_seconds": 3.0,
        "script": [ { "at": 1.5, "object_name": "Cube", "target_position": [1, 2, 3] } ]
    })", cfg));

    CHECK(cfg.command_topic == "cmd");
    CHECK(cfg.feedback_topic == "fb");
    CHECK(cfg.default_duration == 0.5);
    CHECK(cfg.feedback_producer == FeedbackProducer::Broker);
    CHECK(cfg.scene == "s.json");
    CHECK(cfg.log_level == spdlog::level::err);
    CHECK(cfg.tick_rate == 30);
    CHECK(cfg.request_timeout == 4.0);
    CHECK(cfg.headless);
    CHECK(cfg.headless_seconds == 3.0);
    REQUIRE(cfg.script.size() == 1);
    CHECK(cfg.script[0].at == 1.5);
    CHECK(cfg.script[0].object_name == "Cube");
    CHECK(cfg.script[0].target_position.size() == 3);
    CHECK(cfg.script[0].duration == 2.0);
}

TEST_CASE("ConfigLoader — invalid input leaves output untouched", "[config]") {
    RelayConfig cfg;
    cfg.command_topic = "keep";

    CHECK_FALSE(ConfigLoader::load_from_string("{not json", cfg));
    CHECK_FALSE(ConfigLoader::load_from_string(R"({"feedback_producer": "both"})", cfg));
    CHECK_FALSE(ConfigLoader::load_from_string(R"({"log_level": "loud"})", cfg));
    CHECK_FALSE(ConfigLoader::load_from_string(R"({"command_topic": "t", "feedback_topic": "t"})", cfg));
    CHECK_FALSE(ConfigLoader::load_from_string(R"({"command_topic": ""})", cfg));
    CHECK_FALSE(ConfigLoader::load_from_string(R"({"tick_rate": 0})", cfg));
    CHECK_FALSE(ConfigLoader::load_from_string(R"({"default_duration": "long"})", cfg));
    CHECK(cfg.command_topic == "keep");
}

TEST_CASE("ConfigLoader — missing file returns false", "[config]") {
    RelayConfig cfg;
    CHECK_FALSE(ConfigLoader::load("/nonexistent/relay-config.json", cfg));
}
