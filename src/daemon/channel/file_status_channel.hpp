#pragma once

#include "channel/status_channel.hpp"

#include <string>

inline constexpr const char* kStatusFileName = "voice_status.json";

class FileStatusChannel : public StatusChannel {
public:
    explicit FileStatusChannel(std::string path, bool verbose = false);

    std::optional<Status> read() override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    bool verbose_;
};
