#pragma once
#include "../message_bus.hpp"
#include "../messages.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class TrackState { Completed, InProgress };

struct TrackResult {
    TrackState             state = TrackState::InProgress;
    MoveCompletionFeedback feedback; // valid when Completed
};

// ---------------------------------------------------------------------------
// RequestTracker — agent-side correlation of requests and feedback.
//
// Subscribes to the feedback topic and keeps the latest feedback per
// request_id until check() consumes it. Only ids that are in flight are
// recorded: feedback for ids never track()ed, already answered or expired is
// dropped. Track before publishing. Safe to query from another thread than
// the one delivering feedback.
// ---------------------------------------------------------------------------

class RequestTracker {
public:
    RequestTracker(std::shared_ptr<MessageBus> bus, const std::string& feedback_topic);
    ~RequestTracker();

    RequestTracker(const RequestTracker&)            = delete;
    RequestTracker& operator=(const RequestTracker&) = delete;

    // Remember an outgoing request; its feedback is kept and expire() can time it out.
    void track(const std::string& request_id, double issued_at);

    // Stops tracking a request that never went out.
    void forget(const std::string& request_id);

    // Completed consumes the stored feedback; a second check() reports InProgress.
    TrackResult check(const std::string& request_id);

    // Drops tracked requests issued more than `timeout` seconds before `now`
    // that have no feedback yet, and returns their ids.
    std::vector<std::string> expire(double now, double timeout);

    std::size_t pending() const;
    std::size_t completed() const;

private:
    void on_feedback(const std::string& payload);

    std::shared_ptr<MessageBus> bus_;
    MessageBus::SubscriptionId  subscription_ = 0;

    mutable std::mutex                                      mutex_;
    std::unordered_map<std::string, double>                 in_flight_;
    std::unordered_map<std::string, MoveCompletionFeedback> completed_;
};
