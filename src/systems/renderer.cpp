#include "renderer.hpp"
#include "camera.hpp"
#include "../components.hpp"
#include "../math_util.hpp"
#include "broker_hook.hpp"
#include "scripted_agent.hpp"
#include <raylib.h>
#include <rlgl.h>
#include <cstdio>
#include <memory>

using namespace ecs;

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

void RenderSystem::Update(World& world) {
    BeginDrawing();
    ClearBackground({35, 35, 40, 255});

    // 1. Build Camera3D from ViewCamera
    Camera3D camera   = {};
    camera.up         = {0, 1, 0};
    camera.fovy       = 45.0f;
    camera.projection = CAMERA_PERSPECTIVE;
    if (auto* cam = world.try_resource<ViewCamera>()) {
        camera.position = {cam->lerp_pos.x,    cam->lerp_pos.y,    cam->lerp_pos.z};
        camera.target   = {cam->lerp_target.x, cam->lerp_target.y, cam->lerp_target.z};
    }

    // 2. Scene
    BeginMode3D(camera);
        DrawGrid(100, 2.0f);
        world.each<WorldTransform, MeshRenderer>([&](Entity e, WorldTransform& wt, MeshRenderer& mesh) {
            rlPushMatrix();
            rlMultMatrixf((float*)&wt.matrix);
            rlScalef(mesh.scale_offset.x, mesh.scale_offset.y, mesh.scale_offset.z);
            Color col = to_raylib(mesh.color);
            switch (mesh.shape_type) {
                case ShapeType::Box:     DrawCube({0,0,0}, 1.0f, 1.0f, 1.0f, col); break;
                case ShapeType::Sphere:  DrawSphere({0,0,0}, 0.5f, col);            break;
                case ShapeType::Capsule: DrawCapsule({0,0,0}, {0, 1.8f, 0}, 0.4f, 8, 8, col); break;
            }
            rlPopMatrix();

            // Line to the target of a running move
            auto* motion = world.try_get<MotionState>(e);
            if (motion && motion->active) {
                const auto& to = motion->move.target_position;
                Vector3 from = {wt.matrix.m[12], wt.matrix.m[13], wt.matrix.m[14]};
                DrawLine3D(from, {to.x, to.y, to.z}, YELLOW);
                DrawSphereWires({to.x, to.y, to.z}, 0.15f, 6, 6, YELLOW);
            }
        });
    EndMode3D();

    // 3. HUD
    DrawFPS(10, 10);
    DrawText("Commands: one JSON MoveCommand per line on stdin", 10, 30, 20, LIGHTGRAY);
    DrawText("RIGHT MOUSE: Orbit | SCROLL: Zoom | F: Toggle Follow", 10, 55, 20, YELLOW);

    const double now = world.try_resource<SimClock>() ? world.resource<SimClock>().now : 0.0;
    int y = 90;
    char line[256];
    world.each<EntityName, MotionState, LocalTransform>(
        [&](Entity, EntityName& name, MotionState& m, LocalTransform& lt) {
            if (m.active) {
                double f = relay::math::move_fraction(m.move.start_time, m.move.duration, now);
                std::snprintf(line, sizeof(line), "%s  MOVING %3.0f%%  [%.2f, %.2f, %.2f]  %s",
                              name.value.c_str(), f * 100.0,
                              lt.position.x, lt.position.y, lt.position.z,
                              m.move.request_id.c_str());
                DrawText(line, 10, y, 18, GREEN);
            } else {
                std::snprintf(line, sizeof(line), "%s  IDLE  [%.2f, %.2f, %.2f]",
                              name.value.c_str(), lt.position.x, lt.position.y, lt.position.z);
                DrawText(line, 10, y, 18, SKYBLUE);
            }
            y += 22;
        });

    if (auto* hook = world.try_resource<std::shared_ptr<MoveCommandHook>>()) {
        std::snprintf(line, sizeof(line), "broker: %zu audited, %zu malformed%s",
                      (*hook)->audited(), (*hook)->malformed(),
                      (*hook)->is_stand_in() ? " (stand-in executor)" : "");
        DrawText(line, 10, y + 8, 18, LIGHTGRAY);
    }
    if (auto* agent = world.try_resource<AgentState>()) {
        std::snprintf(line, sizeof(line), "agent: %zu pending, %zu ok, %zu failed, %zu timed out",
                      agent->outstanding.size(), agent->succeeded, agent->failed, agent->timed_out);
        DrawText(line, 10, y + 30, 18, LIGHTGRAY);
    }

    EndDrawing();
}
