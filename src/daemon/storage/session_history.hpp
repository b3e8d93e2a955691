#pragma once

#include "session.hpp"

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct SessionRecord {
    int64_t id = 0;
    std::string started_at;
    std::string ended_at;
    std::string guild_id;
    std::string channel_id;
    std::string channel_name;
    std::string user_id;
    std::string end_reason;
};

// Persistent log of recording sessions. Independent of the in-memory
// SessionTable, which is never restored from here.
class SessionHistory {
public:
    SessionHistory();
    ~SessionHistory();

    SessionHistory(const SessionHistory&) = delete;
    SessionHistory& operator=(const SessionHistory&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Returns the new row id, or 0 on failure.
    int64_t record_start(const RecordingSession& session);
    bool record_end(int64_t id, const std::string& reason);

    std::vector<SessionRecord> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* start_stmt_ = nullptr;
    sqlite3_stmt* end_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
