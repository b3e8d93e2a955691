#include "config.hpp"
#include "env_file.hpp"
#include "platform/daemonizer.hpp"
#include "platform/discord/dpp_presence_source.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <print>
#include <string>

namespace fs = std::filesystem;

static void usage() {
    std::println("Usage: archive-bot [options]");
    std::println("Options:");
    std::println("  -d, --daemon          Detach and log to the log file (also BACKGROUND_MODE=true)");
    std::println("  -v, --verbose         Enable verbose logging");
    std::println("  -c, --config PATH     Config file path");
    std::println("  -e, --env-file PATH   Environment file (default: ./.env)");
    std::println("  -h, --help            Show this help");
    std::println("");
    std::println("Required environment (or config file):");
    std::println("  DISCORD_TOKEN=your_bot_token_here");
    std::println("  TARGET_USER_ID=user_id_to_monitor");
}

int main(int argc, char* argv[]) {
    bool daemon = false;
    bool verbose = false;
    std::string config_path;
    std::string env_path = ".env";
    bool env_path_given = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--daemon" || arg == "-d") {
            daemon = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--env-file" || arg == "-e") {
            if (i + 1 < argc) {
                env_path = argv[++i];
                env_path_given = true;
            }
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage();
            return 1;
        }
    }

    // A missing default .env is fine; a missing explicit one is not.
    if (auto loaded = load_env_file(env_path); !loaded && env_path_given) {
        std::println(stderr, "Error: {}", loaded.error());
        return 1;
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    config.apply_env();

    if (auto valid = config.validate(); !valid) {
        std::println(stderr, "Error: {}", valid.error());
        std::println(stderr, "Please configure your .env file with Discord credentials");
        return 1;
    }
    auto watched_user = *config.target_user();

    if (config.email_configured) {
        if (verbose) std::println(stderr, "[archive-bot] Email configuration detected, recordings will be emailed");
    } else {
        std::println(stderr, "Warning: email configuration incomplete, recordings will be saved locally only");
    }

    daemon = daemon || config.background;
    if (daemon) {
        auto log_path = config.log_file;
        if (log_path.empty()) {
            auto data = platform::data_dir();
            if (!data.empty()) {
                std::error_code ec;
                fs::create_directories(data, ec);
                log_path = data + "/archive-bot.log";
            }
        }
        platform::daemonize(log_path);
        // Background mode keeps warnings and errors only
        verbose = false;
    }

    if (verbose) {
        std::println(stderr, "[archive-bot] Starting, monitoring user {}", watched_user);
    }

    DppPresenceSource presence(config.discord.token, verbose);
    LinuxEventLoop loop(std::move(config), watched_user, presence, verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
