#include "session.hpp"

#include <algorithm>

double RecordingSession::duration(std::chrono::steady_clock::time_point now) const {
    return std::chrono::duration<double>(now - started_at).count();
}

SessionState SessionTable::state(Snowflake guild_id) const {
    return sessions_.contains(guild_id) ? SessionState::Recording : SessionState::Idle;
}

const RecordingSession* SessionTable::find(Snowflake guild_id) const {
    auto it = sessions_.find(guild_id);
    return it != sessions_.end() ? &it->second : nullptr;
}

bool SessionTable::begin(RecordingSession session) {
    auto guild_id = session.guild_id;
    return sessions_.try_emplace(guild_id, std::move(session)).second;
}

std::optional<RecordingSession> SessionTable::end(Snowflake guild_id) {
    auto node = sessions_.extract(guild_id);
    if (node.empty()) return std::nullopt;
    return std::move(node.mapped());
}

std::vector<RecordingSession> SessionTable::prune(std::chrono::steady_clock::duration max_age,
                                                  std::chrono::steady_clock::time_point now) {
    std::vector<RecordingSession> dropped;
    std::erase_if(sessions_, [&](auto& entry) {
        if (now - entry.second.started_at <= max_age) return false;
        dropped.push_back(std::move(entry.second));
        return true;
    });
    return dropped;
}

std::vector<RecordingSession> SessionTable::active() const {
    std::vector<RecordingSession> out;
    out.reserve(sessions_.size());
    for (auto& [_, s] : sessions_) out.push_back(s);
    std::ranges::sort(out, {}, &RecordingSession::guild_id);
    return out;
}
