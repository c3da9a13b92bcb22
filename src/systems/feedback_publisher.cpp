#include "feedback_publisher.hpp"
#include <spdlog/spdlog.h>
#include <utility>

FeedbackPublisher::FeedbackPublisher(std::weak_ptr<MessageBus> bus, std::string topic)
    : bus_(std::move(bus)), topic_(std::move(topic)) {}

PublishStatus FeedbackPublisher::publish(MoveCompletionFeedback feedback) {
    if (feedback.timestamp.empty()) feedback.timestamp = MessageCodec::utc_now();

    PublishStatus status = PublishStatus::NotConnected;
    if (auto bus = bus_.lock()) {
        status = bus->publish(topic_, MessageCodec::encode_feedback(feedback));
    }

    if (status != PublishStatus::Ok) {
        ++failed_;
        spdlog::error("feedback: could not publish {} for '{}' (request {}): {}",
                      MessageCodec::to_string(feedback.status), feedback.object_name,
                      feedback.request_id, to_string(status));
        return status;
    }

    ++published_;
    spdlog::info("feedback: {} for '{}' (request {}) at [{}, {}, {}]",
                 MessageCodec::to_string(feedback.status), feedback.object_name, feedback.request_id,
                 feedback.final_position[0], feedback.final_position[1], feedback.final_position[2]);
    return status;
}

PublishStatus FeedbackPublisher::publish_success(const std::string& object_name,
                                                 const WirePosition& final_position,
                                                 const std::string& request_id) {
    MoveCompletionFeedback fb;
    fb.object_name    = object_name;
    fb.final_position = final_position;
    fb.status         = MoveStatus::Success;
    fb.request_id     = request_id;
    return publish(std::move(fb));
}

PublishStatus FeedbackPublisher::publish_failure(const std::string& object_name,
                                                 const WirePosition& final_position,
                                                 const std::string& request_id,
                                                 const char* reason) {
    spdlog::warn("feedback: move for '{}' (request {}) failed: {}", object_name, request_id, reason);
    MoveCompletionFeedback fb;
    fb.object_name    = object_name;
    fb.final_position = final_position;
    fb.status         = MoveStatus::Failure;
    fb.request_id     = request_id;
    return publish(std::move(fb));
}
