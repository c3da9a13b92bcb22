#pragma once
#include "messages.hpp"
#include <spdlog/common.h>
#include <string>
#include <vector>

// Which side of the deployment reports completion. Exactly one producer runs:
// Executor — EntityExecutors + TickMotionScheduler interpolate real entities.
// Broker   — MoveCommandHook + InstantMotionScheduler fake instant success.
enum class FeedbackProducer { Executor, Broker };

// A move the built-in scripted agent issues `at` seconds after start.
struct ScriptedMove {
    double              at = 0.0;
    std::string         object_name;
    std::vector<double> target_position;
    double              duration = kDefaultMoveDuration;
};

struct RelayConfig {
    std::string      command_topic     = kDefaultCommandTopic;
    std::string      feedback_topic    = kDefaultFeedbackTopic;
    double           default_duration  = kDefaultMoveDuration;
    FeedbackProducer feedback_producer = FeedbackProducer::Executor;
    std::string      scene             = "resources/scenes/default.json";

    spdlog::level::level_enum log_level = spdlog::level::info;

    int    tick_rate        = 60;
    double request_timeout  = 15.0;
    bool   headless         = false;
    double headless_seconds = 10.0;

    std::vector<ScriptedMove> script;
};

// ---------------------------------------------------------------------------
// ConfigLoader — reads RelayConfig from JSON. Every key is optional; absent
// keys keep their defaults. Returns false (leaving `out` untouched) on I/O
// errors, malformed JSON, wrong value types or unknown enum strings.
// ---------------------------------------------------------------------------

class ConfigLoader {
public:
    static bool load(const std::string& path, RelayConfig& out);
    static bool load_from_string(const std::string& json, RelayConfig& out);
};

const char* to_string(FeedbackProducer producer);
