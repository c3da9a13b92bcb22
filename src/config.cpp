#include "config.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static FeedbackProducer parse_producer(const std::string& s) {
    if (s == "executor") return FeedbackProducer::Executor;
    if (s == "broker")   return FeedbackProducer::Broker;
    throw std::runtime_error("ConfigLoader: unknown feedback_producer '" + s + "'");
}

static spdlog::level::level_enum parse_level(const std::string& s) {
    if (s == "trace")    return spdlog::level::trace;
    if (s == "debug")    return spdlog::level::debug;
    if (s == "info")     return spdlog::level::info;
    if (s == "warn")     return spdlog::level::warn;
    if (s == "error")    return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    if (s == "off")      return spdlog::level::off;
    throw std::runtime_error("ConfigLoader: unknown log_level '" + s + "'");
}

static ScriptedMove parse_scripted_move(const json& j) {
    ScriptedMove m;
    m.at              = j.value("at", 0.0);
    m.object_name     = j.at("object_name").get<std::string>();
    m.target_position = j.at("target_position").get<std::vector<double>>();
    m.duration        = j.value("duration", kDefaultMoveDuration);
    return m;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool ConfigLoader::load_from_string(const std::string& json_str, RelayConfig& out) {
    try {
        json j = json::parse(json_str);
        RelayConfig cfg;

        cfg.command_topic    = j.value("command_topic",    cfg.command_topic);
        cfg.feedback_topic   = j.value("feedback_topic",   cfg.feedback_topic);
        cfg.default_duration = j.value("default_duration", cfg.default_duration);
        cfg.scene            = j.value("scene",            cfg.scene);
        cfg.tick_rate        = j.value("tick_rate",        cfg.tick_rate);
        cfg.request_timeout  = j.value("request_timeout",  cfg.request_timeout);
        cfg.headless         = j.value("headless",         cfg.headless);
        cfg.headless_seconds = j.value("headless_seconds", cfg.headless_seconds);

        if (j.contains("feedback_producer")) {
            cfg.feedback_producer = parse_producer(j["feedback_producer"].get<std::string>());
        }
        if (j.contains("log_level")) {
            cfg.log_level = parse_level(j["log_level"].get<std::string>());
        }
        if (j.contains("script")) {
            for (const auto& m : j["script"]) cfg.script.push_back(parse_scripted_move(m));
        }

        if (cfg.command_topic.empty() || cfg.feedback_topic.empty()) {
            throw std::runtime_error("ConfigLoader: topics must not be empty");
        }
        if (cfg.command_topic == cfg.feedback_topic) {
            throw std::runtime_error("ConfigLoader: command and feedback topics must differ");
        }
        if (cfg.tick_rate <= 0) {
            throw std::runtime_error("ConfigLoader: tick_rate must be positive");
        }

        out = std::move(cfg);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return false;
    }
}

bool ConfigLoader::load(const std::string& path, RelayConfig& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("ConfigLoader: cannot open '{}'", path);
        return false;
    }
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(content, out);
}

const char* to_string(FeedbackProducer producer) {
    return producer == FeedbackProducer::Executor ? "executor" : "broker";
}
