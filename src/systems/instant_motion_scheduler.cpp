#include "instant_motion_scheduler.hpp"
#include <spdlog/spdlog.h>
#include <utility>

InstantMotionScheduler::InstantMotionScheduler(std::shared_ptr<FeedbackPublisher> feedback)
    : feedback_(std::move(feedback)) {}

SubmitResult InstantMotionScheduler::submit(const MoveCommand& cmd, double /*now*/) {
    if (cmd.target_position.size() != 3) return SubmitResult::InvalidCommand;

    const WirePosition target = {cmd.target_position[0], cmd.target_position[1],
                                 cmd.target_position[2]};
    spdlog::info("stand-in: simulating completion for '{}' to [{}, {}, {}] (request {})",
                 cmd.object_name, target[0], target[1], target[2], cmd.request_id);
    feedback_->publish_success(cmd.object_name, target, cmd.request_id);
    return SubmitResult::Started;
}
