#pragma once
#include <ecs/ecs.hpp>
#include <functional>
#include <utility>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Events<T> — typed, frame-scoped event queue
//
// Stored as a World resource. Systems emit via send() and consume via read().
// EventRegistry::flush_all() clears all queues at the start of each frame.
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

// Sends into the World's Events<T> queue if one is registered; no-op otherwise,
// so headless callers need not register queues they never read.
template<typename T>
void emit(ecs::World& world, T event) {
    if (auto* q = world.try_resource<Events<T>>()) q->send(std::move(event));
}

// ---------------------------------------------------------------------------
// EventRegistry — flush coordinator (stored as a World resource)
//
// Call register_queue<T>(world) once per event type during startup.
// Call flush_all() as the first Pre-Update step each frame.
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        world.set_resource(Events<T>{});
        flush_fns_.push_back([&world]() {
            if (auto* q = world.try_resource<Events<T>>()) q->clear();
        });
    }

    void flush_all() {
        for (auto& fn : flush_fns_) fn();
    }

private:
    std::vector<std::function<void()>> flush_fns_;
};

// ---------------------------------------------------------------------------
// Motion events (emitted by TickMotionScheduler / CommandIngestion)
// ---------------------------------------------------------------------------

// A move began. superseded_request_id is empty when the entity was idle.
struct MoveStartedEvent {
    ecs::Entity entity;
    std::string request_id;
    std::string superseded_request_id;
};

// Entity reached its target; success feedback was attempted.
struct MoveCompletedEvent {
    ecs::Entity entity;
    std::string request_id;
    ecs::Vec3   final_position;
};

// Command for this entity rejected by validation (failure feedback sent).
struct MoveRejectedEvent {
    ecs::Entity entity;
    std::string request_id;
};
