#pragma once
#include "../message_bus.hpp"
#include "feedback_publisher.hpp"
#include "motion_scheduler.hpp"
#include <cstddef>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// MoveCommandHook — broker-side observer on the command topic.
//
// Audit-logs every published move command. When given a stand-in scheduler
// it also plays executor: decoded commands are submitted to it (normally an
// InstantMotionScheduler) so feedback is produced without any real entity
// downstream. Only deploy a stand-in when no EntityExecutor serves the topic.
//
// Malformed payloads are logged and otherwise ignored.
// ---------------------------------------------------------------------------

class MoveCommandHook : public PublishHook {
public:
    explicit MoveCommandHook(std::string command_topic,
                             std::shared_ptr<MotionScheduler> stand_in = nullptr,
                             std::shared_ptr<FeedbackPublisher> feedback = nullptr,
                             double default_duration = kDefaultMoveDuration);

    const char* id() const override { return "MoveCommandHook"; }
    void on_publish(const std::string& topic, const std::string& payload) override;

    bool        is_stand_in() const { return stand_in_ != nullptr; }
    std::size_t audited() const     { return audited_; }
    std::size_t malformed() const   { return malformed_; }

    // Scheduler clock for the stand-in (seconds). Irrelevant for instant
    // completion but forwarded so any driver can be plugged in.
    void set_now(double now) { now_ = now; }

private:
    std::string                        command_topic_;
    std::shared_ptr<MotionScheduler>   stand_in_;
    std::shared_ptr<FeedbackPublisher> feedback_;
    double                             default_duration_;
    double                             now_       = 0.0;
    std::size_t                        audited_   = 0;
    std::size_t                        malformed_ = 0;
};
