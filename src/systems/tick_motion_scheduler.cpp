#include "tick_motion_scheduler.hpp"
#include "../components.hpp"
#include "../entity_registry.hpp"
#include "../events.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

using namespace ecs;

TickMotionScheduler::TickMotionScheduler(World& world, std::shared_ptr<FeedbackPublisher> feedback)
    : world_(world), feedback_(std::move(feedback)) {}

SubmitResult TickMotionScheduler::submit(const MoveCommand& cmd, double now) {
    if (cmd.target_position.size() != 3) return SubmitResult::InvalidCommand;

    auto e = EntityRegistry::find(world_, cmd.object_name);
    if (!e) return SubmitResult::UnknownEntity;

    auto* state = world_.try_get<MotionState>(*e);
    auto* lt    = world_.try_get<LocalTransform>(*e);
    if (!state || !lt) return SubmitResult::UnknownEntity;

    // Bring the running move up to `now` first. If it already reached its end
    // time it completed before this command arrived and still reports success;
    // otherwise the new move starts from the interpolated position.
    if (state->active && !state->tick(now, lt->position)) {
        complete(*e, cmd.object_name, state->move, lt->position);
    }

    const WirePosition target = {cmd.target_position[0], cmd.target_position[1],
                                 cmd.target_position[2]};
    const std::string superseded_id = state->active ? state->move.request_id : std::string{};
    const bool superseded = state->begin(lt->position, target, now, cmd.duration, cmd.request_id);

    if (superseded) {
        spdlog::info("motion: '{}' request {} superseded by {}", cmd.object_name, superseded_id,
                     cmd.request_id);
    }
    spdlog::info("motion: '{}' moving to [{}, {}, {}] over {}s (request {})", cmd.object_name,
                 target[0], target[1], target[2], cmd.duration, cmd.request_id);

    emit(world_, MoveStartedEvent{*e, cmd.request_id, superseded_id});
    return superseded ? SubmitResult::Superseded : SubmitResult::Started;
}

std::size_t TickMotionScheduler::tick(double now) {
    struct Completion {
        Entity      entity;
        std::string name;
        ActiveMove  move;
        Vec3        position;
    };
    std::vector<Completion> done;
    std::size_t moving = 0;

    world_.each<EntityName, MotionState, LocalTransform>(
        [&](Entity e, EntityName& name, MotionState& state, LocalTransform& lt) {
            if (!state.active) return;
            if (state.tick(now, lt.position)) {
                ++moving;
            } else {
                done.push_back({e, name.value, state.move, lt.position});
            }
        });

    // Publish outside the iteration: subscribers may submit new moves.
    for (auto& c : done) complete(c.entity, c.name, c.move, c.position);
    return moving;
}

void TickMotionScheduler::complete(Entity e, const std::string& name, const ActiveMove& move,
                                   const Vec3& position) {
    spdlog::info("motion: '{}' reached [{}, {}, {}] (request {})", name, move.target[0],
                 move.target[1], move.target[2], move.request_id);
    // Feedback echoes the commanded target, not the float-rounded scene position.
    // A failed publish does not undo the move.
    feedback_->publish_success(name, move.target, move.request_id);
    emit(world_, MoveCompletedEvent{e, move.request_id, position});
}
