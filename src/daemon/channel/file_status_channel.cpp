#include "channel/file_status_channel.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <print>

namespace fs = std::filesystem;

FileStatusChannel::FileStatusChannel(std::string path, bool verbose)
    : path_(std::move(path)), verbose_(verbose) {}

std::optional<Status> FileStatusChannel::read() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) return std::nullopt;

    std::ifstream f(path_);
    if (!f.is_open()) {
        if (verbose_) std::println(stderr, "status: cannot open {}", path_);
        return std::nullopt;
    }

    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) {
        if (verbose_) std::println(stderr, "status: read error on {}", path_);
        return std::nullopt;
    }

    auto st = parse_status(text);
    if (!st && verbose_) {
        std::println(stderr, "status: ignoring malformed {}", path_);
    }
    return st;
}
