#pragma once

#include "channel/command_channel.hpp"
#include "channel/status_channel.hpp"
#include "config.hpp"
#include "session.hpp"
#include "storage/session_history.hpp"
#include "voice_state.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

enum class Transition { Ignored, Joined, Left, Moved, Unchanged };

struct TransitionResult {
    Transition kind = Transition::Ignored;
    // False if any command of the transition could not be delivered.
    bool ok = true;
};

// Turns voice-state changes of the watched user into recorder commands.
// Not thread-safe: callers feed it one event at a time.
class Orchestrator {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    Orchestrator(Snowflake watched_user, Config::Confirm confirm,
                 CommandChannel& commands, StatusChannel& status,
                 bool verbose = false, Sleeper sleeper = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // History is optional; without it sessions are only tracked in memory.
    bool open_history(const std::string& path);

    TransitionResult handle_voice_state(const VoiceStateChange& change);

    bool start_manual(Snowflake guild_id, Snowflake channel_id, Snowflake user_id,
                      const std::string& channel_name = {});
    bool stop_manual(Snowflake guild_id);

    // Forgets sessions that have been open longer than max_age. No command is sent.
    size_t prune_stale_sessions(std::chrono::steady_clock::duration max_age);

    // Control socket requests: status, sessions, history, start, stop.
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void shutdown();

    Snowflake watched_user() const { return watched_user_; }
    const SessionTable& sessions() const { return sessions_; }
    uint64_t starts_sent() const { return starts_sent_; }
    uint64_t stops_sent() const { return stops_sent_; }

private:
    TransitionResult on_join(const VoiceStateChange& change);
    TransitionResult on_leave(const VoiceStateChange& change);
    TransitionResult on_move(const VoiceStateChange& change);

    bool start_in(Snowflake guild_id, Snowflake channel_id, Snowflake user_id,
                  const std::string& channel_name);
    bool emit_start(Snowflake guild_id, Snowflake channel_id, Snowflake user_id,
                    const std::string& channel_name);
    bool emit_stop(Snowflake guild_id, const std::string& reason);

    void confirm_start();
    void confirm_stop();
    std::optional<Status> await_status(std::chrono::milliseconds initial,
                                       const std::function<bool(const Status&)>& done);

    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_sessions(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);

    void log(const std::string& msg);

    Snowflake watched_user_;
    Config::Confirm confirm_;
    CommandChannel& commands_;
    StatusChannel& status_;
    bool verbose_;
    Sleeper sleep_;

    SessionTable sessions_;
    SessionHistory history_;

    uint64_t starts_sent_ = 0;
    uint64_t stops_sent_ = 0;
};
