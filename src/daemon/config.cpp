#include "config.hpp"

#include "channel/file_command_channel.hpp"
#include "channel/file_status_channel.hpp"
#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string env_or(const char* name, std::string fallback) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::move(fallback);
}

bool env_flag(const char* name) {
    std::string v = env_or(name, "");
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "true" || v == "1" || v == "yes";
}

// Durations and intervals: a negative value would wrap to weeks of sleep.
void read_uint(const json& section, const char* key, uint32_t& out) {
    auto it = section.find(key);
    if (it == section.end()) return;
    if (!it->is_number_unsigned() || it->get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        std::println(stderr, "config: {} must be a non-negative integer, keeping {}", key, out);
        return;
    }
    out = it->get<uint32_t>();
}

} // namespace

std::string Config::Ipc::command_path() const {
    return (fs::path(directory) / kCommandFileName).string();
}

std::string Config::Ipc::status_path() const {
    return (fs::path(directory) / kStatusFileName).string();
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("discord")) {
            auto& d = j["discord"];
            if (d.contains("token")) cfg.discord.token = d["token"].get<std::string>();
            if (d.contains("target_user_id")) {
                auto& id = d["target_user_id"];
                cfg.discord.target_user_id = id.is_string() ? id.get<std::string>()
                                                            : std::to_string(id.get<uint64_t>());
            }
        }

        if (j.contains("ipc")) {
            auto& i = j["ipc"];
            if (i.contains("directory")) cfg.ipc.directory = i["directory"].get<std::string>();
        }

        if (j.contains("confirm")) {
            auto& c = j["confirm"];
            read_uint(c, "start_delay_ms", cfg.confirm.start_delay_ms);
            read_uint(c, "stop_delay_ms", cfg.confirm.stop_delay_ms);
            read_uint(c, "move_gap_ms", cfg.confirm.move_gap_ms);
            if (c.contains("backoff")) cfg.confirm.backoff = c["backoff"].get<bool>();
            read_uint(c, "timeout_ms", cfg.confirm.timeout_ms);
        }

        if (j.contains("maintenance")) {
            auto& m = j["maintenance"];
            read_uint(m, "interval_s", cfg.maintenance.interval_s);
            read_uint(m, "max_session_age_s", cfg.maintenance.max_session_age_s);
        }

        if (j.contains("log_file")) cfg.log_file = j["log_file"].get<std::string>();

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_env() {
    discord.token = env_or("DISCORD_TOKEN", discord.token);
    discord.target_user_id = env_or("TARGET_USER_ID", discord.target_user_id);
    ipc.directory = env_or("ARCHIVE_IPC_DIR", ipc.directory);
    if (env_flag("BACKGROUND_MODE")) background = true;

    email_configured = !env_or("EMAIL_USER", "").empty() &&
                       !env_or("EMAIL_PASS", "").empty() &&
                       !env_or("EMAIL_RECIPIENT", "").empty();
}

std::expected<void, std::string> Config::validate() const {
    if (discord.token.empty()) {
        return std::unexpected("missing required configuration: DISCORD_TOKEN");
    }
    if (discord.target_user_id.empty()) {
        return std::unexpected("missing required configuration: TARGET_USER_ID");
    }
    if (auto id = target_user(); !id) {
        return std::unexpected("invalid TARGET_USER_ID: " + id.error());
    }
    if (ipc.directory.empty()) {
        return std::unexpected("ipc.directory must not be empty");
    }
    return {};
}

std::expected<Snowflake, std::string> Config::target_user() const {
    return parse_snowflake(discord.target_user_id);
}
