#include "channel/file_command_channel.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Distinct temp file per send, so concurrent senders never share one.
std::string temp_path_for(const std::string& path) {
    static std::atomic<uint64_t> seq{0};
    return std::format("{}.tmp.{}.{}", path, ::getpid(), seq.fetch_add(1, std::memory_order_relaxed));
}

} // namespace

FileCommandChannel::FileCommandChannel(std::string path, Clock clock)
    : path_(std::move(path)), clock_(std::move(clock)) {}

bool FileCommandChannel::send(const Command& cmd) {
    auto action = action_name(cmd);
    if (action.empty()) {
        std::println(stderr, "command: refusing to send a command without an action");
        return false;
    }

    if (auto* custom = std::get_if<CustomCommand>(&cmd);
        custom && !custom->params.is_object() && !custom->params.is_null()) {
        std::println(stderr, "command: params for {} must be an object", action);
        return false;
    }

    std::string body;
    try {
        body = to_record(cmd, clock_()).dump(2);
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "command: failed to serialize {}: {}", action, e.what());
        return false;
    }

    auto tmp_path = temp_path_for(path_);
    {
        std::ofstream f(tmp_path, std::ios::out | std::ios::trunc);
        if (!f.is_open()) {
            std::println(stderr, "command: cannot open {}: {}", tmp_path, std::strerror(errno));
            return false;
        }
        f << body << '\n';
        f.flush();
        if (!f) {
            std::println(stderr, "command: write to {} failed", tmp_path);
            f.close();
            std::error_code ec;
            fs::remove(tmp_path, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path_, ec);
    if (ec) {
        std::println(stderr, "command: failed to publish {} to {}: {}", action, path_, ec.message());
        fs::remove(tmp_path, ec);
        return false;
    }
    return true;
}
