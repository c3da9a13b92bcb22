#pragma once
#include "../config.hpp"
#include "../pipeline.hpp"
#include "../systems/move_requester.hpp"
#include "../systems/request_tracker.hpp"
#include "../systems/scripted_agent.hpp"
#include "transport_module.hpp"
#include <ecs/ecs.hpp>
#include <algorithm>
#include <memory>

// ---------------------------------------------------------------------------
// AgentModule
//
// Creates the agent side of the protocol (RequestTracker subscribed to the
// feedback topic, MoveRequester on the command topic) as the AgentState
// resource and adds ScriptedAgentSystem to the Logic phase.
//
// Install after MotionModule so the motion tick runs before the agent polls:
// feedback for a move completing this frame is seen in the same frame.
// ---------------------------------------------------------------------------

struct AgentModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline, const RelayConfig& cfg) {
        auto bus = TransportModule::bus(world);

        AgentState agent;
        agent.tracker         = std::make_shared<RequestTracker>(bus, cfg.feedback_topic);
        agent.requester       = std::make_shared<MoveRequester>(bus, cfg.command_topic, agent.tracker);
        agent.script          = cfg.script;
        agent.request_timeout = cfg.request_timeout;
        std::stable_sort(agent.script.begin(), agent.script.end(),
                         [](const ScriptedMove& a, const ScriptedMove& b) { return a.at < b.at; });
        world.set_resource(std::move(agent));

        pipeline.add_logic([](ecs::World& w, float) { ScriptedAgentSystem::Update(w); });
    }
};
