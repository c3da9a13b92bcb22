#pragma once
#include <ecs/ecs.hpp>

// Viewer only: draws every MeshRenderer entity and a status line per
// controllable entity (idle or moving, request id, progress).
class RenderSystem {
public:
    static void Update(ecs::World& world);
};
