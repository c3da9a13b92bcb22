#pragma once
#include "../components.hpp"
#include "../config.hpp"
#include "../entity_registry.hpp"
#include "../pipeline.hpp"
#include "../systems/command_ingestion.hpp"
#include "../systems/entity_executor.hpp"
#include "../systems/feedback_publisher.hpp"
#include "../systems/tick_motion_scheduler.hpp"
#include "transport_module.hpp"
#include <ecs/ecs.hpp>
#include <spdlog/spdlog.h>
#include <memory>
#include <vector>

// Keeps the per-entity command subscriptions alive for the World's lifetime.
struct ExecutorSet {
    std::vector<std::shared_ptr<EntityExecutor>> executors;
};

// ---------------------------------------------------------------------------
// MotionModule
//
// Executor deployment: builds FeedbackPublisher → TickMotionScheduler →
// CommandIngestion, subscribes one EntityExecutor per controllable entity
// already in the World, and adds the motion tick to the Logic phase.
//
// Does nothing unless the config selects FeedbackProducer::Executor, so the
// broker stand-in and the executors never both answer the same command.
// Install after TransportModule and after the scene has been loaded.
// ---------------------------------------------------------------------------

struct MotionModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline, const RelayConfig& cfg) {
        if (cfg.feedback_producer != FeedbackProducer::Executor) return;

        auto bus       = TransportModule::bus(world);
        auto feedback  = std::make_shared<FeedbackPublisher>(bus, cfg.feedback_topic);
        auto scheduler = std::make_shared<TickMotionScheduler>(world, feedback);
        auto ingestion = std::make_shared<CommandIngestion>(world, scheduler, feedback,
                                                            cfg.default_duration);

        ExecutorSet set;
        for (const auto& name : EntityRegistry::names(world)) {
            set.executors.push_back(
                std::make_shared<EntityExecutor>(bus, cfg.command_topic, name, ingestion));
        }
        if (set.executors.empty()) {
            spdlog::warn("motion: no controllable entities in scene; commands will be ignored");
        }

        world.set_resource(feedback);
        world.set_resource(std::shared_ptr<MotionScheduler>(scheduler));
        world.set_resource(ingestion);
        world.set_resource(std::move(set));

        pipeline.add_logic([](ecs::World& w, float) {
            const double now = w.resource<SimClock>().now;
            w.resource<std::shared_ptr<MotionScheduler>>()->tick(now);
        });
    }
};
