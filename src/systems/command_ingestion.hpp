#pragma once
#include "../message_bus.hpp"
#include "feedback_publisher.hpp"
#include "motion_scheduler.hpp"
#include <ecs/ecs.hpp>
#include <memory>
#include <string>

enum class IngestOutcome {
    Accepted,
    Ignored,           // addressed to another entity
    MalformedPayload,  // undecodable; no feedback
    UnknownEntity,     // subscriber not in the registry; no feedback
    InvalidPosition,   // wrong arity; failure feedback sent
};

const char* to_string(IngestOutcome outcome);

struct IngestResult {
    IngestOutcome outcome = IngestOutcome::Ignored;
    std::string   request_id;
    double        duration   = 0.0;   // effective duration when Accepted
    bool          superseded = false; // Accepted and replaced a running move
    PublishStatus feedback   = PublishStatus::Ok; // failure feedback status for InvalidPosition

    bool accepted() const { return outcome == IngestOutcome::Accepted; }
};

// ---------------------------------------------------------------------------
// CommandIngestion — validates raw MoveCommand payloads for one subscriber
// entity and hands accepted commands to the MotionScheduler.
//
// Validation outcomes are returned, never thrown. Scheduler time is read from
// the World's SimClock resource.
// ---------------------------------------------------------------------------

class CommandIngestion {
public:
    CommandIngestion(ecs::World& world,
                     std::shared_ptr<MotionScheduler> scheduler,
                     std::shared_ptr<FeedbackPublisher> feedback,
                     double default_duration = kDefaultMoveDuration);

    IngestResult ingest(const std::string& payload, const std::string& subscriber_name);

    double default_duration() const { return default_duration_; }

private:
    ecs::World&                        world_;
    std::shared_ptr<MotionScheduler>   scheduler_;
    std::shared_ptr<FeedbackPublisher> feedback_;
    double                             default_duration_;
};
