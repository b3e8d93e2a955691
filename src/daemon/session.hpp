#pragma once

#include "snowflake.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class SessionState { Idle, Recording };

struct RecordingSession {
    Snowflake guild_id = 0;
    Snowflake channel_id = 0;
    std::string channel_name;
    Snowflake user_id = 0;
    std::chrono::steady_clock::time_point started_at;
    std::string started_iso;
    // Row in the session history, 0 when history is disabled.
    int64_t history_id = 0;

    double duration(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const;
};

// Active recordings, at most one per guild.
class SessionTable {
public:
    SessionState state(Snowflake guild_id) const;
    const RecordingSession* find(Snowflake guild_id) const;

    // Fails if the guild already has a session.
    bool begin(RecordingSession session);
    std::optional<RecordingSession> end(Snowflake guild_id);

    // Drops sessions older than max_age and returns them.
    std::vector<RecordingSession> prune(std::chrono::steady_clock::duration max_age,
                                        std::chrono::steady_clock::time_point now =
                                            std::chrono::steady_clock::now());

    std::vector<RecordingSession> active() const;
    size_t size() const { return sessions_.size(); }
    bool empty() const { return sessions_.empty(); }

private:
    std::unordered_map<Snowflake, RecordingSession> sessions_;
};
