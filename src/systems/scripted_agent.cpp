#include "scripted_agent.hpp"
#include "../components.hpp"
#include "../messages.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

void ScriptedAgentSystem::Update(ecs::World& world) {
    auto* agent = world.try_resource<AgentState>();
    if (!agent) return;
    auto* clock = world.try_resource<SimClock>();
    const double now = clock ? clock->now : 0.0;

    // 1. Issue due moves
    while (agent->next < agent->script.size() && agent->script[agent->next].at <= now) {
        const auto& m = agent->script[agent->next++];
        auto r = agent->requester->initiate_move(m.object_name, m.target_position, m.duration, now);
        if (r.ok) {
            agent->outstanding.push_back(r.request_id);
        } else {
            spdlog::warn("agent: scripted move for '{}' not sent: {}", m.object_name, r.message);
        }
    }

    // 2. Collect feedback
    auto& ids = agent->outstanding;
    ids.erase(std::remove_if(ids.begin(), ids.end(), [&](const std::string& id) {
        TrackResult r = agent->requester->check_status(id);
        if (r.state != TrackState::Completed) return false;
        const auto& fb = r.feedback;
        if (fb.status == MoveStatus::Success) {
            agent->succeeded++;
            spdlog::info("agent: request {} for '{}' succeeded at [{}, {}, {}]", id,
                         fb.object_name, fb.final_position[0], fb.final_position[1], fb.final_position[2]);
        } else {
            agent->failed++;
            spdlog::warn("agent: request {} for '{}' failed at [{}, {}, {}]", id,
                         fb.object_name, fb.final_position[0], fb.final_position[1], fb.final_position[2]);
        }
        return true;
    }), ids.end());

    // 3. Time out the rest
    for (const auto& id : agent->tracker->expire(now, agent->request_timeout)) {
        agent->timed_out++;
        spdlog::warn("agent: request {} timed out after {}s", id, agent->request_timeout);
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    }
}
