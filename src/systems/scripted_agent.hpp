#pragma once
#include "../config.hpp"
#include "move_requester.hpp"
#include "request_tracker.hpp"
#include <ecs/ecs.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// World resource: the agent's script and the requests it is waiting on.
struct AgentState {
    std::shared_ptr<RequestTracker> tracker;
    std::shared_ptr<MoveRequester>  requester;
    std::vector<ScriptedMove>       script;       // sorted by `at`
    std::size_t                     next = 0;     // first script entry not yet issued
    std::vector<std::string>        outstanding;  // ids issued and not yet resolved
    double                          request_timeout = 15.0;
    std::size_t                     succeeded = 0;
    std::size_t                     failed    = 0;
    std::size_t                     timed_out = 0;
};

// Plays the agent side of the protocol from config: issues scripted moves
// when the clock passes their `at`, polls the tracker for their feedback and
// times out requests nobody answered.
class ScriptedAgentSystem {
public:
    static void Update(ecs::World& world);
};
