#pragma once
#include "../pipeline.hpp"
#include "../systems/camera.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform_propagation.hpp>
#include <raylib.h>

// ---------------------------------------------------------------------------
// RenderModule
//
// Viewer only. Creates the ViewCamera world resource and adds the Render
// phase: propagate transforms, update the camera, draw.
// Headless runs never install this module.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(ViewCamera{});
        pipeline.add_render([](ecs::World& w, float) {
            ecs::propagate_transforms(w);
            CameraSystem::Update(w, GetFrameTime());
            RenderSystem::Update(w);
        });
    }
};
