#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

inline constexpr std::string_view kStatusReady = "ready";
inline constexpr std::string_view kStatusRecording = "recording";
inline constexpr std::string_view kStatusStopped = "stopped";

// Last status published by the recorder process.
struct Status {
    std::string status;
    std::string message;
    std::string timestamp;
    nlohmann::json extra = nlohmann::json::object();

    // Backend has released the voice connection.
    bool is_idle() const { return status == kStatusStopped || status == kStatusReady; }
    bool is_recording() const { return status == kStatusRecording; }
};

// A document without a string "status" member is not a status.
std::optional<Status> status_from_json(const nlohmann::json& doc);
std::optional<Status> parse_status(std::string_view text);

nlohmann::json to_json(const Status& status);
