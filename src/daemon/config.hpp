#pragma once

#include "snowflake.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

struct Config {
    struct Discord {
        std::string token;
        // Kept as text until validate(); both JSON strings and numbers are accepted.
        std::string target_user_id;
    } discord;

    struct Ipc {
        std::string directory = ".";

        std::string command_path() const;
        std::string status_path() const;
    } ipc;

    struct Confirm {
        uint32_t start_delay_ms = 2000;
        uint32_t stop_delay_ms = 5000;
        uint32_t move_gap_ms = 1000;
        // Poll with exponential backoff until the expected status or timeout_ms.
        bool backoff = false;
        uint32_t timeout_ms = 15000;
    } confirm;

    struct Maintenance {
        uint32_t interval_s = 600;
        uint32_t max_session_age_s = 86400;

        std::chrono::seconds max_session_age() const { return std::chrono::seconds(max_session_age_s); }
    } maintenance;

    std::string log_file;
    bool background = false;
    // Informational only; delivery is done by the recorder.
    bool email_configured = false;

    static Config load(const std::string& path);
    static Config load_default();

    // DISCORD_TOKEN, TARGET_USER_ID, BACKGROUND_MODE, ARCHIVE_IPC_DIR, EMAIL_*.
    void apply_env();

    std::expected<void, std::string> validate() const;
    std::expected<Snowflake, std::string> target_user() const;
};
