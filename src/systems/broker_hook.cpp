#include "broker_hook.hpp"
#include "../math_util.hpp"
#include <spdlog/spdlog.h>
#include <utility>

MoveCommandHook::MoveCommandHook(std::string command_topic,
                                 std::shared_ptr<MotionScheduler> stand_in,
                                 std::shared_ptr<FeedbackPublisher> feedback,
                                 double default_duration)
    : command_topic_(std::move(command_topic)),
      stand_in_(std::move(stand_in)),
      feedback_(std::move(feedback)),
      default_duration_(default_duration > 0.0 ? default_duration : kDefaultMoveDuration) {}

void MoveCommandHook::on_publish(const std::string& topic, const std::string& payload) {
    if (topic != command_topic_) return;

    ++audited_;
    spdlog::info("audit: move command on '{}': {}", topic, payload);

    MoveCommand cmd;
    if (MessageCodec::decode_command(payload, cmd) != DecodeStatus::Ok) {
        ++malformed_;
        spdlog::error("audit: malformed move command, no feedback sent");
        return;
    }
    if (!stand_in_) return;

    cmd.duration = relay::math::normalize_duration(cmd.duration, default_duration_);
    if (stand_in_->submit(cmd, now_) == SubmitResult::InvalidCommand) {
        // The broker knows no entity positions; report the origin.
        if (feedback_) {
            feedback_->publish_failure(cmd.object_name, {0, 0, 0}, cmd.request_id,
                                       "target_position must have 3 components");
        }
    }
}
