#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  status                                  Show recorder and daemon status");
    std::println(stderr, "  sessions                                List active recording sessions");
    std::println(stderr, "  history [--limit N]                     Show past recording sessions");
    std::println(stderr, "  start --guild G --channel C [--user U]  Send start_recording");
    std::println(stderr, "  stop --guild G                          Send stop_recording");
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string guild, channel, user;
    int limit = 10;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--guild" && i + 1 < argc) {
            guild = argv[++i];
        } else if (arg == "--channel" && i + 1 < argc) {
            channel = argv[++i];
        } else if (arg == "--user" && i + 1 < argc) {
            user = argv[++i];
        }
    }

    json cmd;
    if (command == "status" || command == "sessions") {
        cmd = {{"cmd", command}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "start") {
        if (guild.empty() || channel.empty()) {
            std::println(stderr, "start needs --guild and --channel");
            return 1;
        }
        // IDs stay strings; the daemon parses them.
        cmd = {{"cmd", "start"}, {"guild", guild}, {"channel", channel}};
        if (!user.empty()) cmd["user"] = user;
    } else if (command == "stop") {
        if (guild.empty()) {
            std::println(stderr, "stop needs --guild");
            return 1;
        }
        cmd = {{"cmd", "stop"}, {"guild", guild}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is archive-bot running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        std::println("Watched user: {}", response.value("watched_user", ""));
        std::println("Active sessions: {}", response.value("sessions", 0));
        std::println("Commands sent: {} start, {} stop",
                     response.value("starts_sent", 0), response.value("stops_sent", 0));
        auto& rec = response["recorder"];
        if (rec.is_object()) {
            std::println("Recorder: {} - {}", rec.value("status", ""), rec.value("message", ""));
        } else {
            std::println("Recorder: no status available");
        }
    } else if (command == "sessions") {
        auto& sessions = response["sessions"];
        if (sessions.empty()) std::println("No active sessions");
        for (auto& s : sessions) {
            std::println("guild {} channel {} ({}) since {} [{:.0f}s]",
                         s.value("guild_id", ""), s.value("channel_id", ""),
                         s.value("channel_name", ""), s.value("started_at", ""),
                         s.value("duration", 0.0));
        }
    } else if (command == "history") {
        for (auto& e : response["entries"]) {
            auto ended = e["ended_at"].is_string() ? e["ended_at"].get<std::string>() : "open";
            std::println("[{}] guild {} channel {} until {}", e.value("started_at", ""),
                         e.value("guild_id", ""), e.value("channel_id", ""), ended);
            if (e["end_reason"].is_string()) {
                std::println("  Ended: {}", e["end_reason"].get<std::string>());
            }
        }
    } else {
        std::println("{}", response.value("message", "OK"));
    }

    return 0;
}
