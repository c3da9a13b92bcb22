#pragma once
#include <ecs/ecs.hpp>

// World resource: orbit camera for the viewer. Engine-agnostic; the renderer
// converts it to a Raylib Camera3D.
struct ViewCamera {
    float     orbit_phi      = 0.6f;
    float     orbit_theta    = 1.0f;
    float     orbit_distance = 18.0f;
    bool      follow_mode    = true;   // track the first moving entity
    ecs::Vec3 lerp_pos       = {0, 10, 18};
    ecs::Vec3 lerp_target    = {0, 0, 0};
};

// Viewer only: reads mouse/keyboard and eases the camera toward its focus.
// Runs in the Render phase so headless runs never touch Raylib input.
class CameraSystem {
public:
    static void Update(ecs::World& world, float dt);
};
