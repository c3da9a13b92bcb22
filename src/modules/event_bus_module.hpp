#pragma once
#include "../events.hpp"
#include "../pipeline.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// EventBusModule
//
// Creates the EventRegistry world resource, registers the motion event
// queues (MoveStartedEvent, MoveCompletedEvent, MoveRejectedEvent) and
// installs the per-frame flush as the first Pre-Update step. Must be the first
// module installed so the queues exist before any scheduler emits into them.
// ---------------------------------------------------------------------------

struct EventBusModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(EventRegistry{});
        auto& reg = world.resource<EventRegistry>();
        reg.register_queue<MoveStartedEvent>(world);
        reg.register_queue<MoveCompletedEvent>(world);
        reg.register_queue<MoveRejectedEvent>(world);

        pipeline.add_pre_update([](ecs::World& w, float) {
            w.resource<EventRegistry>().flush_all();
        });
    }
};
