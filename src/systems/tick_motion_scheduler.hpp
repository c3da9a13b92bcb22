#pragma once
#include "../components.hpp"
#include "feedback_publisher.hpp"
#include "motion_scheduler.hpp"
#include <ecs/ecs.hpp>
#include <memory>

// Frame/timer driven scheduler over the controllable entities of a World.
// Runs in the Logic phase; owns all writes to ecs::LocalTransform::position
// of entities that carry a MotionState.
class TickMotionScheduler : public MotionScheduler {
public:
    TickMotionScheduler(ecs::World& world, std::shared_ptr<FeedbackPublisher> feedback);

    SubmitResult submit(const MoveCommand& cmd, double now) override;
    std::size_t  tick(double now) override;

private:
    void complete(ecs::Entity e, const std::string& name, const ActiveMove& move,
                  const ecs::Vec3& position);

    ecs::World&                        world_;
    std::shared_ptr<FeedbackPublisher> feedback_;
};
