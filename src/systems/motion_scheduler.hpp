#pragma once
#include "../messages.hpp"
#include <cstddef>

enum class SubmitResult {
    Started,        // entity was idle
    Superseded,     // a running move was discarded without feedback
    UnknownEntity,
    InvalidCommand, // target not three components
};

// ---------------------------------------------------------------------------
// MotionScheduler — executes accepted move commands.
//
// Two drivers exist and a deployment selects exactly one of them as its
// feedback producer:
//   TickMotionScheduler    — interpolates entities across ticks (executor).
//   InstantMotionScheduler — completes on submit without any entity state
//                            (broker stand-in).
//
// submit() expects a validated command: three-component target and a
// positive duration (CommandIngestion normalises both).
// ---------------------------------------------------------------------------

class MotionScheduler {
public:
    virtual ~MotionScheduler() = default;

    virtual SubmitResult submit(const MoveCommand& cmd, double now) = 0;

    // Advances every in-flight move to `now`. Returns how many are still moving.
    virtual std::size_t tick(double now) = 0;
};
