#include "move_requester.hpp"
#include "../messages.hpp"
#include <datapod/datapod.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdio>
#include <utility>

MoveRequester::MoveRequester(std::shared_ptr<MessageBus> bus, std::string command_topic,
                             std::shared_ptr<RequestTracker> tracker)
    : bus_(std::move(bus)), command_topic_(std::move(command_topic)), tracker_(std::move(tracker)) {}

InitiateResult MoveRequester::initiate_move(const std::string& object_name,
                                            const std::vector<double>& target_position,
                                            double duration, double now) {
    InitiateResult result;
    if (target_position.size() != 3) {
        result.message = "Invalid target_position. Must be a list of 3 numbers.";
        return result;
    }
    for (double v : target_position) {
        if (!std::isfinite(v)) {
            result.message = "Invalid target_position. Components must be finite.";
            return result;
        }
    }
    if (!(duration > 0.0)) {
        result.message = "Invalid duration. Must be a positive number.";
        return result;
    }

    MoveCommand cmd;
    cmd.object_name     = object_name;
    cmd.target_position = target_position;
    cmd.duration        = duration;
    cmd.request_id      = make_request_id();

    // Track before publishing: synchronous delivery may complete it at once.
    tracker_->track(cmd.request_id, now);
    result.publish = bus_->publish(command_topic_, MessageCodec::encode_command(cmd));
    if (result.publish != PublishStatus::Ok) {
        result.message = std::string("Failed to send move command: ") + to_string(result.publish);
        spdlog::error("requester: {}", result.message);
        tracker_->forget(cmd.request_id);
        return result;
    }

    result.ok         = true;
    result.request_id = cmd.request_id;
    char buf[160];
    std::snprintf(buf, sizeof(buf), "Move command initiated for %s to [%g, %g, %g] over %g seconds.",
                  object_name.c_str(), target_position[0], target_position[1], target_position[2], duration);
    result.message = buf;
    spdlog::info("requester: {} (request {})", result.message, result.request_id);
    return result;
}

std::string MoveRequester::make_request_id() {
    return std::string(datapod::sugar::uuid::generate_v4().c_str());
}
