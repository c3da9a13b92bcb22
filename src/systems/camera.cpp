#include "camera.hpp"
#include "../components.hpp"
#include <raylib.h>
#include <raymath.h>
#include <algorithm>
#include <cmath>

using namespace ecs;

static Vector3 to_raylib(const Vec3& v) { return {v.x, v.y, v.z}; }

void CameraSystem::Update(World& world, float dt) {
    auto* cam = world.try_resource<ViewCamera>();
    if (!cam) return;

    // 1. Input
    if (IsKeyPressed(KEY_F)) cam->follow_mode = !cam->follow_mode;

    if (IsMouseButtonDown(MOUSE_BUTTON_RIGHT)) {
        Vector2 delta = GetMouseDelta();
        cam->orbit_phi   -= delta.x * 0.005f;
        cam->orbit_theta -= delta.y * 0.005f;
    }
    cam->orbit_theta = std::clamp(cam->orbit_theta, 0.1f, PI * 0.45f);

    float wheel = GetMouseWheelMove();
    if (std::abs(wheel) > 0.1f) {
        cam->orbit_distance = std::clamp(cam->orbit_distance - wheel * 2.0f, 5.0f, 80.0f);
    }

    // 2. Focus: first moving entity in follow mode, otherwise the origin
    Vector3 focus = {0, 0, 0};
    if (cam->follow_mode) {
        bool found = false;
        world.each<MotionState, WorldTransform>([&](Entity, MotionState& m, WorldTransform& wt) {
            if (found || !m.active) return;
            focus = {wt.matrix.m[12], wt.matrix.m[13], wt.matrix.m[14]};
            found = true;
        });
    }

    // 3. Finalize
    float x = cam->orbit_distance * sinf(cam->orbit_theta) * sinf(cam->orbit_phi);
    float y = cam->orbit_distance * cosf(cam->orbit_theta);
    float z = cam->orbit_distance * sinf(cam->orbit_theta) * cosf(cam->orbit_phi);

    Vector3 pos    = Vector3Lerp(to_raylib(cam->lerp_pos), Vector3Add(focus, {x, y, z}), 8.0f * dt);
    Vector3 target = Vector3Lerp(to_raylib(cam->lerp_target), focus, 12.0f * dt);
    cam->lerp_pos    = {pos.x, pos.y, pos.z};
    cam->lerp_target = {target.x, target.y, target.z};
}
