#pragma once
#include "../config.hpp"
#include "../pipeline.hpp"
#include "../systems/broker_hook.hpp"
#include "../systems/feedback_publisher.hpp"
#include "../systems/instant_motion_scheduler.hpp"
#include "transport_module.hpp"
#include <ecs/ecs.hpp>
#include <memory>

// ---------------------------------------------------------------------------
// BrokerModule
//
// Installs MoveCommandHook on the bus. The hook always audits; it becomes the
// stand-in executor (InstantMotionScheduler) only when the config selects
// FeedbackProducer::Broker. Install after TransportModule.
// ---------------------------------------------------------------------------

struct BrokerModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline, const RelayConfig& cfg) {
        auto bus = TransportModule::bus(world);

        std::shared_ptr<MoveCommandHook> hook;
        if (cfg.feedback_producer == FeedbackProducer::Broker) {
            auto feedback = std::make_shared<FeedbackPublisher>(bus, cfg.feedback_topic);
            auto stand_in = std::make_shared<InstantMotionScheduler>(feedback);
            hook = std::make_shared<MoveCommandHook>(cfg.command_topic, stand_in, feedback,
                                                     cfg.default_duration);
        } else {
            hook = std::make_shared<MoveCommandHook>(cfg.command_topic);
        }
        bus->add_hook(hook);
        world.set_resource(hook);

        // Runs after TransportModule's pump, so commands pumped this frame see
        // the previous frame's time. InstantMotionScheduler ignores it.
        if (hook->is_stand_in()) {
            pipeline.add_pre_update([](ecs::World& w, float) {
                w.resource<std::shared_ptr<MoveCommandHook>>()->set_now(w.resource<SimClock>().now);
            });
        }
    }
};
