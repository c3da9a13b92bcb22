#include "messages.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstddef>
#include <ctime>
#include <utility>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Optional string field: absent or null reads as "", anything else but a
// string is malformed.
static bool read_string(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) { out.clear(); return true; }
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

static bool read_finite(const json& j, double& out) {
    if (!j.is_number()) return false;
    const double v = j.get<double>();
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

// ---------------------------------------------------------------------------
// MoveCommand
// ---------------------------------------------------------------------------

DecodeStatus MessageCodec::decode_command(const std::string& payload, MoveCommand& out) {
    json j = json::parse(payload, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return DecodeStatus::MalformedPayload;

    MoveCommand cmd;
    if (!read_string(j, "object_name", cmd.object_name)) return DecodeStatus::MalformedPayload;
    if (!read_string(j, "request_id",  cmd.request_id))  return DecodeStatus::MalformedPayload;

    if (auto it = j.find("target_position"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) return DecodeStatus::MalformedPayload;
        cmd.target_position.reserve(it->size());
        for (const auto& component : *it) {
            double v = 0.0;
            if (!read_finite(component, v)) return DecodeStatus::MalformedPayload;
            cmd.target_position.push_back(v);
        }
    }

    if (auto it = j.find("duration"); it != j.end() && !it->is_null()) {
        if (!it->is_number()) return DecodeStatus::MalformedPayload;
        cmd.duration = it->get<double>();
        if (!std::isfinite(cmd.duration)) return DecodeStatus::MalformedPayload;
    }

    out = std::move(cmd);
    return DecodeStatus::Ok;
}

std::string MessageCodec::encode_command(const MoveCommand& cmd) {
    json j;
    j["object_name"]     = cmd.object_name;
    j["target_position"] = cmd.target_position;
    j["duration"]        = cmd.duration;
    j["request_id"]      = cmd.request_id;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// ---------------------------------------------------------------------------
// MoveCompletionFeedback
// ---------------------------------------------------------------------------

DecodeStatus MessageCodec::decode_feedback(const std::string& payload, MoveCompletionFeedback& out) {
    json j = json::parse(payload, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return DecodeStatus::MalformedPayload;

    MoveCompletionFeedback fb;
    if (!read_string(j, "object_name", fb.object_name)) return DecodeStatus::MalformedPayload;
    if (!read_string(j, "timestamp",   fb.timestamp))   return DecodeStatus::MalformedPayload;
    if (!read_string(j, "request_id",  fb.request_id))  return DecodeStatus::MalformedPayload;

    auto pos = j.find("final_position");
    if (pos == j.end() || !pos->is_array() || pos->size() != 3) return DecodeStatus::MalformedPayload;
    for (std::size_t i = 0; i < fb.final_position.size(); ++i) {
        if (!read_finite((*pos)[i], fb.final_position[i])) return DecodeStatus::MalformedPayload;
    }

    auto status = j.find("status");
    if (status == j.end() || !status->is_string()) return DecodeStatus::MalformedPayload;
    const auto& s = status->get_ref<const std::string&>();
    if (s == "success")      fb.status = MoveStatus::Success;
    else if (s == "failure") fb.status = MoveStatus::Failure;
    else return DecodeStatus::MalformedPayload;

    out = std::move(fb);
    return DecodeStatus::Ok;
}

std::string MessageCodec::encode_feedback(const MoveCompletionFeedback& fb) {
    json j;
    j["object_name"]    = fb.object_name;
    j["final_position"] = fb.final_position;
    j["status"]         = to_string(fb.status);
    j["timestamp"]      = fb.timestamp;
    j["request_id"]     = fb.request_id;
    // `replace` keeps encoding total for names that are not valid UTF-8.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// ---------------------------------------------------------------------------
// Misc
// ---------------------------------------------------------------------------

std::string MessageCodec::format_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

std::string MessageCodec::utc_now() {
    return format_timestamp(std::chrono::system_clock::now());
}

const char* MessageCodec::to_string(MoveStatus status) {
    return status == MoveStatus::Success ? "success" : "failure";
}
