#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class PublishStatus { Ok, NotConnected, InvalidTopic };

const char* to_string(PublishStatus status);

// ---------------------------------------------------------------------------
// PublishHook — broker-side observer.
//
// on_publish() runs exactly once per published message, before the message is
// delivered to any subscriber, and regardless of whether the topic has
// subscribers. Hooks may publish; those messages are queued behind the one
// being observed.
// ---------------------------------------------------------------------------

class PublishHook {
public:
    virtual ~PublishHook() = default;
    virtual const char* id() const = 0;
    virtual void on_publish(const std::string& topic, const std::string& payload) = 0;
};

// ---------------------------------------------------------------------------
// MessageBus — in-process topic broker.
//
// Stored as a World resource (shared_ptr). publish() delivers synchronously on
// the calling thread; a publish issued from inside a handler or hook is queued
// and delivered once the current message has reached every subscriber, so
// per-topic order always matches publish order.
//
// post() is the only thread-safe entry point: it parks a message in an inbox
// that pump() publishes on the owning thread (once per frame, Pre-Update).
// ---------------------------------------------------------------------------

class MessageBus {
public:
    using Handler        = std::function<void(const std::string& topic, const std::string& payload)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(std::string topic, Handler handler);
    void           unsubscribe(SubscriptionId id);
    void           add_hook(std::shared_ptr<PublishHook> hook);

    PublishStatus publish(const std::string& topic, std::string payload);

    void        post(std::string topic, std::string payload);
    std::size_t pump();

    // Simulates the transport link. While disconnected publish() returns
    // NotConnected and nothing is delivered or observed.
    void set_connected(bool connected) { connected_ = connected; }
    bool is_connected() const          { return connected_; }

    std::size_t subscriber_count(const std::string& topic) const;

private:
    struct Subscription {
        SubscriptionId id;
        std::string    topic;
        Handler        handler;
    };

    struct Message {
        std::string topic;
        std::string payload;
    };

    void drain();

    std::vector<Subscription>                 subs_;
    std::vector<std::shared_ptr<PublishHook>> hooks_;
    std::deque<Message>                       pending_;
    SubscriptionId                            next_id_     = 1;
    bool                                      dispatching_ = false;
    bool                                      connected_   = true;

    std::mutex           inbox_mutex_;
    std::vector<Message> inbox_;
};
