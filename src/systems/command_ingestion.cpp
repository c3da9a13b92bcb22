#include "command_ingestion.hpp"
#include "../components.hpp"
#include "../entity_registry.hpp"
#include "../events.hpp"
#include "../math_util.hpp"
#include <spdlog/spdlog.h>
#include <utility>

const char* to_string(IngestOutcome outcome) {
    switch (outcome) {
        case IngestOutcome::Accepted:         return "accepted";
        case IngestOutcome::Ignored:          return "ignored";
        case IngestOutcome::MalformedPayload: return "malformed payload";
        case IngestOutcome::UnknownEntity:    return "unknown entity";
        case IngestOutcome::InvalidPosition:  return "invalid position";
    }
    return "unknown";
}

CommandIngestion::CommandIngestion(ecs::World& world,
                                   std::shared_ptr<MotionScheduler> scheduler,
                                   std::shared_ptr<FeedbackPublisher> feedback,
                                   double default_duration)
    : world_(world),
      scheduler_(std::move(scheduler)),
      feedback_(std::move(feedback)),
      default_duration_(default_duration > 0.0 ? default_duration : kDefaultMoveDuration) {}

IngestResult CommandIngestion::ingest(const std::string& payload, const std::string& subscriber_name) {
    IngestResult result;

    MoveCommand cmd;
    if (MessageCodec::decode_command(payload, cmd) != DecodeStatus::Ok) {
        // No request_id can be trusted, so nobody is told.
        spdlog::error("ingest: malformed move command dropped: {}", payload);
        result.outcome = IngestOutcome::MalformedPayload;
        return result;
    }
    result.request_id = cmd.request_id;

    if (cmd.object_name != subscriber_name) {
        spdlog::debug("ingest: '{}' ignoring command for '{}'", subscriber_name, cmd.object_name);
        result.outcome = IngestOutcome::Ignored;
        return result;
    }

    auto entity = EntityRegistry::find(world_, subscriber_name);
    auto* lt    = entity ? world_.try_get<ecs::LocalTransform>(*entity) : nullptr;
    if (!lt) {
        spdlog::debug("ingest: no controllable entity named '{}'", subscriber_name);
        result.outcome = IngestOutcome::UnknownEntity;
        return result;
    }

    if (cmd.target_position.size() != 3) {
        result.outcome  = IngestOutcome::InvalidPosition;
        result.feedback = feedback_->publish_failure(cmd.object_name, to_wire(lt->position), cmd.request_id,
                                                     "target_position must have 3 components");
        emit(world_, MoveRejectedEvent{*entity, cmd.request_id});
        return result;
    }

    cmd.duration = relay::math::normalize_duration(cmd.duration, default_duration_);

    double now = 0.0;
    if (auto* clock = world_.try_resource<SimClock>()) now = clock->now;

    switch (scheduler_->submit(cmd, now)) {
        case SubmitResult::Started:
            result.outcome = IngestOutcome::Accepted;
            break;
        case SubmitResult::Superseded:
            result.outcome    = IngestOutcome::Accepted;
            result.superseded = true;
            break;
        case SubmitResult::UnknownEntity:
            result.outcome = IngestOutcome::UnknownEntity;
            return result;
        case SubmitResult::InvalidCommand:
            result.outcome = IngestOutcome::InvalidPosition;
            return result;
    }
    result.duration = cmd.duration;
    return result;
}
