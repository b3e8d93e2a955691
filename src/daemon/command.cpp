#include "command.hpp"

#include <format>

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

std::string action_name(const Command& cmd) {
    return std::visit(overloaded{
        [](const StartRecording&) { return std::string(kStartRecording); },
        [](const StopRecording&) { return std::string(kStopRecording); },
        [](const CustomCommand& c) { return c.action; },
    }, cmd);
}

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    return std::format("{:%FT%T}Z", std::chrono::floor<std::chrono::microseconds>(tp));
}

nlohmann::json to_record(const Command& cmd, std::chrono::system_clock::time_point now) {
    nlohmann::json record = nlohmann::json::object();

    std::visit(overloaded{
        [&](const StartRecording& c) {
            record["guildId"] = to_wire(c.guild_id);
            record["channelId"] = to_wire(c.channel_id);
            record["targetUserId"] = to_wire(c.target_user_id);
        },
        [&](const StopRecording& c) {
            record["guildId"] = to_wire(c.guild_id);
        },
        [&](const CustomCommand& c) {
            if (!c.params.is_object()) return;
            for (auto& [key, value] : c.params.items()) {
                record[key] = value;
            }
        },
    }, cmd);

    record["action"] = action_name(cmd);
    record["timestamp"] = iso_timestamp(now);
    return record;
}
