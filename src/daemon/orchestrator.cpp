#include "orchestrator.hpp"

#include <algorithm>
#include <expected>
#include <format>
#include <print>
#include <thread>

using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

std::expected<Snowflake, std::string> snowflake_arg(const json& cmd, const char* key) {
    auto it = cmd.find(key);
    if (it == cmd.end()) return std::unexpected(std::format("missing {}", key));
    if (it->is_number_unsigned()) return parse_snowflake(std::to_string(it->get<Snowflake>()));
    if (it->is_string()) return parse_snowflake(it->get<std::string>());
    return std::unexpected(std::format("{} must be a decimal string", key));
}

json error_response(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

} // namespace

Orchestrator::Orchestrator(Snowflake watched_user, Config::Confirm confirm,
                           CommandChannel& commands, StatusChannel& status,
                           bool verbose, Sleeper sleeper)
    : watched_user_(watched_user), confirm_(confirm),
      commands_(commands), status_(status), verbose_(verbose),
      sleep_(sleeper ? std::move(sleeper)
                     : Sleeper([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })) {}

Orchestrator::~Orchestrator() = default;

bool Orchestrator::open_history(const std::string& path) {
    if (!history_.open(path)) {
        std::println(stderr, "Warning: session history failed to open, history disabled");
        return false;
    }
    log("Session history at " + path);
    return true;
}

TransitionResult Orchestrator::handle_voice_state(const VoiceStateChange& change) {
    if (change.user_id != watched_user_) return {Transition::Ignored, true};

    if (!change.before && change.after) return on_join(change);
    if (change.before && !change.after) return on_leave(change);
    if (change.before && change.after && *change.before != *change.after) return on_move(change);
    return {Transition::Unchanged, true};
}

TransitionResult Orchestrator::on_join(const VoiceStateChange& change) {
    log(std::format("Target user {} joined {} (guild {})",
                    change.user_name, change.channel_name, change.guild_id));

    bool ok = start_in(change.guild_id, *change.after, watched_user_, change.channel_name);
    if (ok) confirm_start();
    return {Transition::Joined, ok};
}

TransitionResult Orchestrator::on_leave(const VoiceStateChange& change) {
    log(std::format("Target user {} left channel {} (guild {})",
                    change.user_name, *change.before, change.guild_id));

    bool ok = emit_stop(change.guild_id, "left");
    if (ok) confirm_stop();
    return {Transition::Left, ok};
}

TransitionResult Orchestrator::on_move(const VoiceStateChange& change) {
    log(std::format("Target user {} moved from {} to {} (guild {})",
                    change.user_name, *change.before, change.channel_name, change.guild_id));

    // The recorder has no move primitive. Recording pauses for move_gap_ms.
    bool stopped = emit_stop(change.guild_id, "moved");
    sleep_(std::chrono::milliseconds(confirm_.move_gap_ms));
    bool started = emit_start(change.guild_id, *change.after, watched_user_, change.channel_name);

    if (started) {
        log("Recording moved to new channel");
    } else {
        std::println(stderr, "orchestrator: failed to restart recording in channel {}", *change.after);
    }
    return {Transition::Moved, stopped && started};
}

bool Orchestrator::start_manual(Snowflake guild_id, Snowflake channel_id, Snowflake user_id,
                                const std::string& channel_name) {
    return start_in(guild_id, channel_id, user_id, channel_name);
}

bool Orchestrator::stop_manual(Snowflake guild_id) {
    return emit_stop(guild_id, "manual");
}

bool Orchestrator::start_in(Snowflake guild_id, Snowflake channel_id, Snowflake user_id,
                            const std::string& channel_name) {
    if (auto* current = sessions_.find(guild_id)) {
        log(std::format("Guild {} is already recording channel {}, stopping it first",
                        guild_id, current->channel_id));
        // Without a delivered stop the recorder would see start, start.
        if (!emit_stop(guild_id, "replaced")) {
            std::println(stderr, "orchestrator: not starting in guild {}, previous recording not stopped",
                         guild_id);
            return false;
        }
        sleep_(std::chrono::milliseconds(confirm_.move_gap_ms));
    }
    return emit_start(guild_id, channel_id, user_id, channel_name);
}

bool Orchestrator::emit_start(Snowflake guild_id, Snowflake channel_id, Snowflake user_id,
                              const std::string& channel_name) {
    log(std::format("Starting recording - guild {}, channel {}", guild_id,
                    channel_name.empty() ? to_wire(channel_id) : channel_name));

    if (!commands_.send(StartRecording{guild_id, channel_id, user_id})) {
        std::println(stderr, "orchestrator: failed to send start_recording for guild {}", guild_id);
        return false;
    }
    ++starts_sent_;

    // A session left over from a failed stop is superseded by this start.
    if (auto stale = sessions_.end(guild_id)) {
        history_.record_end(stale->history_id, "replaced");
    }

    RecordingSession session{
        .guild_id = guild_id,
        .channel_id = channel_id,
        .channel_name = channel_name,
        .user_id = user_id,
        .started_at = std::chrono::steady_clock::now(),
        .started_iso = iso_timestamp(std::chrono::system_clock::now()),
    };
    session.history_id = history_.record_start(session);
    sessions_.begin(std::move(session));

    log("Recording request sent to recorder");
    return true;
}

bool Orchestrator::emit_stop(Snowflake guild_id, const std::string& reason) {
    log(std::format("Stopping recording - guild {}", guild_id));

    if (!commands_.send(StopRecording{guild_id})) {
        std::println(stderr, "orchestrator: failed to send stop_recording for guild {}", guild_id);
        return false;
    }
    ++stops_sent_;

    if (auto session = sessions_.end(guild_id)) {
        history_.record_end(session->history_id, reason);
        log(std::format("Stop request sent, session lasted {:.1f}s", session->duration()));
    } else {
        log(std::format("Stop request sent (no tracked session in guild {})", guild_id));
    }
    return true;
}

void Orchestrator::confirm_start() {
    auto st = await_status(std::chrono::milliseconds(confirm_.start_delay_ms),
                           [](const Status& s) { return s.is_recording(); });
    if (st) {
        log(std::format("Recorder: {} - {}", st->status, st->message));
    }
}

void Orchestrator::confirm_stop() {
    auto st = await_status(std::chrono::milliseconds(confirm_.stop_delay_ms),
                           [](const Status& s) { return s.is_idle(); });
    if (!st) {
        log("No status from recorder after stop");
        return;
    }

    log(std::format("Recorder final status: {} - {}", st->status, st->message));
    if (st->is_idle()) {
        log("Recorder disconnected from voice channel");
    } else {
        std::println(stderr, "orchestrator: recorder may still be connected, status: {}", st->status);
    }
}

std::optional<Status> Orchestrator::await_status(std::chrono::milliseconds initial,
                                                 const std::function<bool(const Status&)>& done) {
    sleep_(initial);
    auto st = status_.read();
    if (!confirm_.backoff || (st && done(*st))) return st;

    const auto timeout = std::chrono::milliseconds(confirm_.timeout_ms);
    auto waited = initial;
    auto delay = std::max(initial, std::chrono::milliseconds(100));

    while (waited < timeout) {
        delay = std::min(delay * 2, timeout - waited);
        sleep_(delay);
        waited += delay;

        st = status_.read();
        if (st && done(*st)) break;
    }
    return st;
}

size_t Orchestrator::prune_stale_sessions(std::chrono::steady_clock::duration max_age) {
    auto dropped = sessions_.prune(max_age);
    for (auto& s : dropped) {
        history_.record_end(s.history_id, "expired");
    }
    if (!dropped.empty()) {
        log(std::format("Cleaned up {} old recording sessions", dropped.size()));
    }
    return dropped.size();
}

json Orchestrator::handle_command(const std::string& cmd_str, const json& cmd) {
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "sessions") return handle_sessions(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "stop") return handle_stop(cmd);
    return error_response("unknown command");
}

json Orchestrator::handle_status(const json& /*cmd*/) {
    json resp = {
        {"status", "ok"},
        {"watched_user", to_wire(watched_user_)},
        {"sessions", sessions_.size()},
        {"starts_sent", starts_sent_},
        {"stops_sent", stops_sent_},
    };
    if (auto st = status_.read()) {
        resp["recorder"] = to_json(*st);
    } else {
        resp["recorder"] = nullptr;
    }
    return resp;
}

json Orchestrator::handle_sessions(const json& /*cmd*/) {
    json resp = {{"status", "ok"}, {"sessions", json::array()}};
    for (auto& s : sessions_.active()) {
        resp["sessions"].push_back({
            {"guild_id", to_wire(s.guild_id)},
            {"channel_id", to_wire(s.channel_id)},
            {"channel_name", s.channel_name},
            {"user_id", to_wire(s.user_id)},
            {"started_at", s.started_iso},
            {"duration", s.duration()},
        });
    }
    return resp;
}

json Orchestrator::handle_history(const json& cmd) {
    if (!history_.is_open()) return error_response("history disabled");

    int limit = 10;
    if (auto it = cmd.find("limit"); it != cmd.end() && it->is_number_integer()) {
        limit = std::clamp(it->get<int>(), 1, 1000);
    }

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : history_.recent(limit)) {
        json entry = {
            {"id", e.id},
            {"started_at", e.started_at},
            {"guild_id", e.guild_id},
            {"channel_id", e.channel_id},
            {"channel_name", e.channel_name},
            {"user_id", e.user_id},
        };
        entry["ended_at"] = e.ended_at.empty() ? json(nullptr) : json(e.ended_at);
        entry["end_reason"] = e.end_reason.empty() ? json(nullptr) : json(e.end_reason);
        resp["entries"].push_back(std::move(entry));
    }
    return resp;
}

json Orchestrator::handle_start(const json& cmd) {
    auto guild = snowflake_arg(cmd, "guild");
    if (!guild) return error_response(guild.error());
    auto channel = snowflake_arg(cmd, "channel");
    if (!channel) return error_response(channel.error());

    Snowflake user = watched_user_;
    if (cmd.contains("user")) {
        auto u = snowflake_arg(cmd, "user");
        if (!u) return error_response(u.error());
        user = *u;
    }

    if (!start_manual(*guild, *channel, user)) {
        return error_response("failed to send start_recording");
    }
    return {{"status", "ok"}, {"message", "start_recording sent"}};
}

json Orchestrator::handle_stop(const json& cmd) {
    auto guild = snowflake_arg(cmd, "guild");
    if (!guild) return error_response(guild.error());

    if (!stop_manual(*guild)) {
        return error_response("failed to send stop_recording");
    }
    return {{"status", "ok"}, {"message", "stop_recording sent"}};
}

void Orchestrator::shutdown() {
    // The recorder keeps running on its own; only the history rows are closed.
    for (auto& s : sessions_.active()) {
        history_.record_end(s.history_id, "daemon_exit");
    }
    history_.close();
}

void Orchestrator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[archive-bot] {}", msg);
    }
}
