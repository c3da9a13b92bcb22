#include "components.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "pipeline.hpp"
#include "scene.hpp"
#include "stdin_source.hpp"
#include "modules/agent_module.hpp"
#include "modules/broker_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/motion_module.hpp"
#include "modules/render_module.hpp"
#include "modules/transport_module.hpp"
#include "systems/scripted_agent.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

static const char* DEFAULT_CONFIG_PATH = "resources/config.json";

static void log_summary(ecs::World& world) {
    if (auto* agent = world.try_resource<AgentState>()) {
        spdlog::info("agent summary: {} succeeded, {} failed, {} timed out, {} pending",
                     agent->succeeded, agent->failed, agent->timed_out, agent->outstanding.size());
    }
    if (auto* fb = world.try_resource<std::shared_ptr<FeedbackPublisher>>()) {
        spdlog::info("feedback summary: {} published, {} failed", (*fb)->published(), (*fb)->failed());
    }
}

// Fixed-step loop paced in real time so stdin commands see a wall clock.
// headless_seconds <= 0 runs until stdin closes and every move has finished.
static void run_headless(ecs::World& world, ecs::Pipeline& pipeline,
                         const RelayConfig& cfg, const StdinSource& input) {
    const float dt = 1.0f / static_cast<float>(cfg.tick_rate);
    const auto  step = std::chrono::duration<double>(dt);
    spdlog::info("headless: {} Hz for {}", cfg.tick_rate,
                 cfg.headless_seconds > 0 ? std::to_string(cfg.headless_seconds) + "s" : std::string("until stdin closes"));

    while (true) {
        pipeline.update(world, dt);
        const double now = world.resource<SimClock>().now;

        if (cfg.headless_seconds > 0) {
            if (now >= cfg.headless_seconds) break;
        } else if (input.finished()) {
            bool busy = false;
            world.each<MotionState>([&](ecs::Entity, MotionState& m) { busy = busy || m.active; });
            if (auto* agent = world.try_resource<AgentState>()) {
                busy = busy || !agent->outstanding.empty() || agent->next < agent->script.size();
            }
            if (!busy) break;
        }
        std::this_thread::sleep_for(step);
    }
}

static void run_viewer(ecs::World& world, ecs::Pipeline& pipeline, const RelayConfig& cfg) {
    relay::logging::forward_raylib();
    InitWindow(1280, 720, "Motion Relay");
    SetTargetFPS(cfg.tick_rate);

    RenderModule::install(world, pipeline);

    while (!WindowShouldClose()) {
        pipeline.update(world, GetFrameTime());
        pipeline.render(world);
    }

    CloseWindow();
}

int main(int argc, char** argv) {
    relay::logging::init(spdlog::level::info);

    const char* config_path = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;
    RelayConfig cfg;
    if (!ConfigLoader::load(config_path, cfg)) {
        spdlog::critical("cannot start without a valid config ('{}')", config_path);
        return 1;
    }
    spdlog::set_level(cfg.log_level);
    spdlog::info("config '{}': commands on '{}', feedback on '{}', producer {}",
                 config_path, cfg.command_topic, cfg.feedback_topic, to_string(cfg.feedback_producer));

    ecs::World    world;
    ecs::Pipeline pipeline;

    // --- Module Installation ---
    // Order matters:
    //   EventBusModule first: registers event queues and the flush step.
    //   TransportModule: bus + clock, consumed by every later module.
    //   Scene before MotionModule: executors are created per loaded entity.
    //   MotionModule before AgentModule: motion tick runs before the agent polls.
    EventBusModule::install(world, pipeline);
    TransportModule::install(world, pipeline);

    if (!SceneLoader::load(world, cfg.scene)) {
        spdlog::critical("cannot start without a valid scene ('{}')", cfg.scene);
        return 1;
    }

    MotionModule::install(world, pipeline, cfg);
    BrokerModule::install(world, pipeline, cfg);
    AgentModule::install(world, pipeline, cfg);

    StdinSource input(TransportModule::bus(world), cfg.command_topic);
    input.start();

    if (cfg.headless) {
        run_headless(world, pipeline, cfg, input);
    } else {
        run_viewer(world, pipeline, cfg);
    }

    input.stop();
    log_summary(world);
    return 0;
}
