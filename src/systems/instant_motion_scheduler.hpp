#pragma once
#include "feedback_publisher.hpp"
#include "motion_scheduler.hpp"
#include <memory>

// Stand-in executor for deployments without a real motion engine: every
// submitted move is reported as reached instantly (final_position = target).
// Keeps no entity state, so tick() has nothing to advance.
class InstantMotionScheduler : public MotionScheduler {
public:
    explicit InstantMotionScheduler(std::shared_ptr<FeedbackPublisher> feedback);

    SubmitResult submit(const MoveCommand& cmd, double now) override;
    std::size_t  tick(double /*now*/) override { return 0; }

    std::shared_ptr<FeedbackPublisher> feedback() const { return feedback_; }

private:
    std::shared_ptr<FeedbackPublisher> feedback_;
};
