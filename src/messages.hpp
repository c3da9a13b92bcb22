#pragma once
#include <ecs/ecs.hpp>
#include <array>
#include <chrono>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Wire contracts for the move-command protocol.
//
// Field names are fixed for compatibility with existing publishers:
//   MoveCommand            { object_name, target_position[3], duration, request_id }
//   MoveCompletionFeedback { object_name, final_position[3], status, timestamp, request_id }
// ---------------------------------------------------------------------------

inline constexpr const char* kDefaultCommandTopic  = "unity/commands/move";
inline constexpr const char* kDefaultFeedbackTopic = "unity/feedback/move_complete";
inline constexpr double      kDefaultMoveDuration  = 2.0;

// Positions as they travel on the wire. Targets are echoed back in feedback
// exactly as received; only the scene itself runs in float.
using WirePosition = std::array<double, 3>;

inline WirePosition to_wire(const ecs::Vec3& v) {
    return {static_cast<double>(v.x), static_cast<double>(v.y), static_cast<double>(v.z)};
}

struct MoveCommand {
    std::string         object_name;
    // Kept at wire arity; length is validated by CommandIngestion, not here.
    std::vector<double> target_position;
    // 0 when the field is absent.
    double              duration = 0.0;
    std::string         request_id;
};

enum class MoveStatus { Success, Failure };

struct MoveCompletionFeedback {
    std::string  object_name;
    WirePosition final_position = {0, 0, 0};
    MoveStatus   status         = MoveStatus::Success;
    std::string  timestamp;
    std::string  request_id;
};

enum class DecodeStatus { Ok, MalformedPayload };

// JSON codec. Decoding never throws and never writes a partially populated
// value into `out`; encoding is total.
class MessageCodec {
public:
    static DecodeStatus decode_command(const std::string& payload, MoveCommand& out);
    static std::string  encode_command(const MoveCommand& cmd);

    static DecodeStatus decode_feedback(const std::string& payload, MoveCompletionFeedback& out);
    static std::string  encode_feedback(const MoveCompletionFeedback& fb);

    // UTC, seconds precision: 2024-05-01T12:00:00Z
    static std::string format_timestamp(std::chrono::system_clock::time_point tp);
    static std::string utc_now();

    static const char* to_string(MoveStatus status);
};
