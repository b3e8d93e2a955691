#pragma once

#include "snowflake.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <variant>

inline constexpr std::string_view kStartRecording = "start_recording";
inline constexpr std::string_view kStopRecording = "stop_recording";

struct StartRecording {
    Snowflake guild_id = 0;
    Snowflake channel_id = 0;
    Snowflake target_user_id = 0;
};

struct StopRecording {
    Snowflake guild_id = 0;
};

// Any action the recorder understands that has no dedicated variant here.
// Keys of params are merged into the record next to action and timestamp.
struct CustomCommand {
    std::string action;
    nlohmann::json params = nlohmann::json::object();
};

using Command = std::variant<StartRecording, StopRecording, CustomCommand>;

std::string action_name(const Command& cmd);

// UTC, microsecond precision: 2026-01-31T08:15:02.123456Z
std::string iso_timestamp(std::chrono::system_clock::time_point tp);

// Builds the on-disk record. IDs are emitted as decimal strings. The action and
// timestamp keys always win over same-named keys in a CustomCommand bag.
nlohmann::json to_record(const Command& cmd, std::chrono::system_clock::time_point now);
