#include "message_bus.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

const char* to_string(PublishStatus status) {
    switch (status) {
        case PublishStatus::Ok:           return "ok";
        case PublishStatus::NotConnected: return "not connected";
        case PublishStatus::InvalidTopic: return "invalid topic";
    }
    return "unknown";
}

MessageBus::SubscriptionId MessageBus::subscribe(std::string topic, Handler handler) {
    const SubscriptionId id = next_id_++;
    spdlog::debug("bus: subscription {} on '{}'", id, topic);
    subs_.push_back({id, std::move(topic), std::move(handler)});
    return id;
}

void MessageBus::unsubscribe(SubscriptionId id) {
    subs_.erase(std::remove_if(subs_.begin(), subs_.end(),
                               [id](const Subscription& s) { return s.id == id; }),
                subs_.end());
}

void MessageBus::add_hook(std::shared_ptr<PublishHook> hook) {
    if (!hook) return;
    spdlog::info("bus: hook '{}' installed", hook->id());
    hooks_.push_back(std::move(hook));
}

PublishStatus MessageBus::publish(const std::string& topic, std::string payload) {
    if (!connected_)   return PublishStatus::NotConnected;
    if (topic.empty()) return PublishStatus::InvalidTopic;

    pending_.push_back({topic, std::move(payload)});
    if (!dispatching_) drain();
    return PublishStatus::Ok;
}

void MessageBus::drain() {
    // Resets the flag even if a handler throws, so the next publish can drain
    // whatever is still queued.
    struct DispatchScope {
        bool& flag;
        explicit DispatchScope(bool& f) : flag(f) { flag = true; }
        ~DispatchScope() { flag = false; }
    } scope(dispatching_);

    while (!pending_.empty()) {
        Message msg = std::move(pending_.front());
        pending_.pop_front();

        for (auto& hook : hooks_) hook->on_publish(msg.topic, msg.payload);

        // Snapshot so handlers may (un)subscribe while we deliver.
        std::vector<Handler> targets;
        for (const auto& s : subs_) {
            if (s.topic == msg.topic) targets.push_back(s.handler);
        }
        spdlog::trace("bus: '{}' -> {} subscriber(s)", msg.topic, targets.size());
        for (auto& handler : targets) handler(msg.topic, msg.payload);
    }
}

void MessageBus::post(std::string topic, std::string payload) {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    inbox_.push_back({std::move(topic), std::move(payload)});
}

std::size_t MessageBus::pump() {
    std::vector<Message> batch;
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        batch.swap(inbox_);
    }

    std::size_t delivered = 0;
    for (auto& msg : batch) {
        const PublishStatus status = publish(msg.topic, std::move(msg.payload));
        if (status == PublishStatus::Ok) {
            ++delivered;
        } else {
            spdlog::warn("bus: dropped posted message on '{}': {}", msg.topic, to_string(status));
        }
    }
    return delivered;
}

std::size_t MessageBus::subscriber_count(const std::string& topic) const {
    return static_cast<std::size_t>(std::count_if(subs_.begin(), subs_.end(),
        [&topic](const Subscription& s) { return s.topic == topic; }));
}
