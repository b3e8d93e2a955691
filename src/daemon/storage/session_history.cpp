#include "storage/session_history.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

SessionHistory::SessionHistory() = default;

SessionHistory::~SessionHistory() {
    close();
}

bool SessionHistory::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* start_sql =
        "INSERT INTO sessions (started_at, guild_id, channel_id, channel_name, user_id) "
        "VALUES (COALESCE(?, strftime('%Y-%m-%dT%H:%M:%fZ','now')), ?, ?, ?, ?)";

    const char* end_sql =
        "UPDATE sessions SET ended_at = strftime('%Y-%m-%dT%H:%M:%fZ','now'), end_reason = ? "
        "WHERE id = ? AND ended_at IS NULL";

    const char* recent_sql =
        "SELECT id, started_at, ended_at, guild_id, channel_id, channel_name, user_id, end_reason "
        "FROM sessions ORDER BY id DESC LIMIT ?";

    struct { const char* sql; sqlite3_stmt** stmt; const char* name; } stmts[] = {
        {start_sql, &start_stmt_, "start"},
        {end_sql, &end_stmt_, "end"},
        {recent_sql, &recent_stmt_, "recent"},
    };
    for (auto& s : stmts) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.stmt, nullptr) != SQLITE_OK) {
            std::println(stderr, "db: prepare {} failed: {}", s.name, sqlite3_errmsg(db_));
            close();
            return false;
        }
    }

    return true;
}

void SessionHistory::close() {
    if (start_stmt_) { sqlite3_finalize(start_stmt_); start_stmt_ = nullptr; }
    if (end_stmt_) { sqlite3_finalize(end_stmt_); end_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

int64_t SessionHistory::record_start(const RecordingSession& session) {
    if (!start_stmt_) return 0;

    auto guild = to_wire(session.guild_id);
    auto channel = to_wire(session.channel_id);
    auto user = to_wire(session.user_id);

    sqlite3_reset(start_stmt_);
    if (session.started_iso.empty()) sqlite3_bind_null(start_stmt_, 1);
    else sqlite3_bind_text(start_stmt_, 1, session.started_iso.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(start_stmt_, 2, guild.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(start_stmt_, 3, channel.c_str(), -1, SQLITE_TRANSIENT);
    if (session.channel_name.empty()) sqlite3_bind_null(start_stmt_, 4);
    else sqlite3_bind_text(start_stmt_, 4, session.channel_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(start_stmt_, 5, user.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(start_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: insert session failed: {}", sqlite3_errmsg(db_));
        return 0;
    }
    return sqlite3_last_insert_rowid(db_);
}

bool SessionHistory::record_end(int64_t id, const std::string& reason) {
    if (!end_stmt_ || id <= 0) return false;

    sqlite3_reset(end_stmt_);
    sqlite3_bind_text(end_stmt_, 1, reason.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(end_stmt_, 2, id);

    if (sqlite3_step(end_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: close session {} failed: {}", id, sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) == 1;
}

std::vector<SessionRecord> SessionHistory::recent(int limit) {
    std::vector<SessionRecord> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        SessionRecord r;
        r.id = sqlite3_column_int64(recent_stmt_, 0);
        r.started_at = get_text(recent_stmt_, 1);
        r.ended_at = get_text(recent_stmt_, 2);
        r.guild_id = get_text(recent_stmt_, 3);
        r.channel_id = get_text(recent_stmt_, 4);
        r.channel_name = get_text(recent_stmt_, 5);
        r.user_id = get_text(recent_stmt_, 6);
        r.end_reason = get_text(recent_stmt_, 7);
        entries.push_back(std::move(r));
    }

    return entries;
}

bool SessionHistory::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            started_at TEXT NOT NULL,
            ended_at TEXT,
            guild_id TEXT NOT NULL,
            channel_id TEXT NOT NULL,
            channel_name TEXT,
            user_id TEXT NOT NULL,
            end_reason TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
