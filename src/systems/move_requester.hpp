#pragma once
#include "../message_bus.hpp"
#include "request_tracker.hpp"
#include <memory>
#include <string>
#include <vector>

struct InitiateResult {
    bool          ok = false;
    std::string   message;
    std::string   request_id;                 // set when ok
    PublishStatus publish = PublishStatus::Ok;
};

// Agent-side producer of MoveCommands. Validates locally, stamps a fresh
// request id, publishes, and registers the id with the tracker. Does not wait
// for completion; poll check_status() with the returned id.
class MoveRequester {
public:
    MoveRequester(std::shared_ptr<MessageBus> bus, std::string command_topic,
                  std::shared_ptr<RequestTracker> tracker);

    InitiateResult initiate_move(const std::string& object_name,
                                 const std::vector<double>& target_position,
                                 double duration, double now);

    TrackResult check_status(const std::string& request_id) { return tracker_->check(request_id); }

    // Random (version 4) UUID, canonical 8-4-4-4-12 form.
    static std::string make_request_id();

private:
    std::shared_ptr<MessageBus>     bus_;
    std::string                     command_topic_;
    std::shared_ptr<RequestTracker> tracker_;
};
