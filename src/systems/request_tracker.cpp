#include "request_tracker.hpp"
#include <spdlog/spdlog.h>
#include <utility>

RequestTracker::RequestTracker(std::shared_ptr<MessageBus> bus, const std::string& feedback_topic)
    : bus_(std::move(bus)) {
    subscription_ = bus_->subscribe(feedback_topic, [this](const std::string&, const std::string& payload) {
        on_feedback(payload);
    });
}

RequestTracker::~RequestTracker() {
    bus_->unsubscribe(subscription_);
}

void RequestTracker::on_feedback(const std::string& payload) {
    MoveCompletionFeedback fb;
    if (MessageCodec::decode_feedback(payload, fb) != DecodeStatus::Ok) {
        spdlog::warn("tracker: undecodable feedback dropped: {}", payload);
        return;
    }
    if (fb.request_id.empty()) {
        spdlog::warn("tracker: feedback without request_id for '{}' dropped", fb.object_name);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = fb.request_id;
    auto it = in_flight_.find(id);
    if (it == in_flight_.end()) {
        spdlog::debug("tracker: feedback for untracked request {} dropped", id);
        return;
    }
    in_flight_.erase(it);
    spdlog::info("tracker: request {} completed ({})", id, MessageCodec::to_string(fb.status));
    completed_[id] = std::move(fb);
}

void RequestTracker::track(const std::string& request_id, double issued_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_[request_id] = issued_at;
}

void RequestTracker::forget(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(request_id);
}

TrackResult RequestTracker::check(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    TrackResult result;
    auto it = completed_.find(request_id);
    if (it == completed_.end()) return result;

    result.state    = TrackState::Completed;
    result.feedback = std::move(it->second);
    completed_.erase(it);
    return result;
}

std::vector<std::string> RequestTracker::expire(double now, double timeout) {
    std::vector<std::string> expired;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        if (now - it->second > timeout) {
            spdlog::warn("tracker: request {} timed out after {}s", it->first, timeout);
            expired.push_back(it->first);
            it = in_flight_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

std::size_t RequestTracker::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

std::size_t RequestTracker::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_.size();
}
