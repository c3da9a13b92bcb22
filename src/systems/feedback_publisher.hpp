#pragma once
#include "../message_bus.hpp"
#include "../messages.hpp"
#include <cstddef>
#include <memory>
#include <string>

// Publishes MoveCompletionFeedback on the feedback topic.
//
// Failures are logged and returned to the caller, never retried here: the
// entity's move is complete locally whether or not the notification went out.
// Holds the bus weakly (the bus owns hooks that own publishers).
class FeedbackPublisher {
public:
    FeedbackPublisher(std::weak_ptr<MessageBus> bus, std::string topic);

    // Stamps `timestamp` with the current UTC time when empty.
    PublishStatus publish(MoveCompletionFeedback feedback);

    PublishStatus publish_success(const std::string& object_name, const WirePosition& final_position,
                                  const std::string& request_id);
    PublishStatus publish_failure(const std::string& object_name, const WirePosition& final_position,
                                  const std::string& request_id, const char* reason);

    const std::string& topic() const { return topic_; }
    std::size_t published() const    { return published_; }
    std::size_t failed() const       { return failed_; }

private:
    std::weak_ptr<MessageBus> bus_;
    std::string               topic_;
    std::size_t               published_ = 0;
    std::size_t               failed_    = 0;
};
