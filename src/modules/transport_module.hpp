#pragma once
#include "../components.hpp"
#include "../message_bus.hpp"
#include "../pipeline.hpp"
#include <ecs/ecs.hpp>
#include <memory>

// ---------------------------------------------------------------------------
// TransportModule
//
// Creates the shared MessageBus world resource and the SimClock, and adds
// two Pre-Update steps: advance the clock by the frame's dt, then pump
// messages posted from other threads (stdin reader). Pumping after the clock
// step means commands are stamped with the time of the frame that handles
// them. Install after EventBusModule.
// ---------------------------------------------------------------------------

struct TransportModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(std::make_shared<MessageBus>());
        world.set_resource(SimClock{});

        pipeline.add_pre_update([](ecs::World& w, float dt) {
            w.resource<SimClock>().now += static_cast<double>(dt);
        });
        pipeline.add_pre_update([](ecs::World& w, float) {
            w.resource<std::shared_ptr<MessageBus>>()->pump();
        });
    }

    static std::shared_ptr<MessageBus> bus(ecs::World& world) {
        auto* ptr = world.try_resource<std::shared_ptr<MessageBus>>();
        return ptr ? *ptr : nullptr;
    }
};
