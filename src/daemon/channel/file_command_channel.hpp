#pragma once

#include "channel/command_channel.hpp"

#include <chrono>
#include <functional>
#include <string>

inline constexpr const char* kCommandFileName = "voice_commands.json";

class FileCommandChannel : public CommandChannel {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit FileCommandChannel(std::string path, Clock clock = std::chrono::system_clock::now);

    // Replaces the command file with a single record. The record is written to
    // a sibling temp file and renamed into place.
    bool send(const Command& cmd) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    Clock clock_;
};
