#include <catch2/catch_test_macros.hpp>

#include "channel/file_command_channel.hpp"

#include <chrono>
#include <iterator>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct TmpDir {
    fs::path path;

    TmpDir() {
        path = fs::temp_directory_path() / ("ab_test_cmd_" + std::to_string(getpid()));
        fs::create_directories(path);
    }

    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

json read_json(const fs::path& p) {
    std::ifstream f(p);
    return json::parse(f);
}

} // namespace

TEST_CASE("FileCommandChannel", "[command_channel]") {
    TmpDir dir;
    auto file = dir.path / kCommandFileName;
    FileCommandChannel channel(file.string());

    SECTION("StartWritesExactFields") {
        REQUIRE(channel.send(StartRecording{111, 222, 333}));

        auto j = read_json(file);
        REQUIRE(j.size() == 5);
        REQUIRE(j["action"] == "start_recording");
        REQUIRE(j["guildId"] == "111");
        REQUIRE(j["channelId"] == "222");
        REQUIRE(j["targetUserId"] == "333");
        REQUIRE(j["timestamp"].is_string());
        REQUIRE_FALSE(j["timestamp"].get<std::string>().empty());
    }

    SECTION("StopFullyOverwritesStart") {
        REQUIRE(channel.send(StartRecording{111, 222, 333}));
        REQUIRE(channel.send(StopRecording{111}));

        auto j = read_json(file);
        REQUIRE(j.size() == 3);
        REQUIRE(j["action"] == "stop_recording");
        REQUIRE(j["guildId"] == "111");
        REQUIRE(j.contains("timestamp"));
        REQUIRE_FALSE(j.contains("channelId"));
        REQUIRE_FALSE(j.contains("targetUserId"));
    }

    SECTION("UsesInjectedClock") {
        using namespace std::chrono;
        FileCommandChannel fixed(file.string(), [] { return sys_days{2025y / 6 / 30} + 23h + 59min + 59s; });
        REQUIRE(fixed.send(StopRecording{5}));
        REQUIRE(read_json(file)["timestamp"] == "2025-06-30T23:59:59.000000Z");
    }

    SECTION("NoTempFilesLeftBehind") {
        REQUIRE(channel.send(StartRecording{1, 2, 3}));
        REQUIRE(channel.send(StopRecording{1}));

        auto count = std::distance(fs::directory_iterator(dir.path), fs::directory_iterator{});
        REQUIRE(count == 1);
    }

    SECTION("MissingDirectoryFailsWithoutThrowing") {
        FileCommandChannel broken((dir.path / "nope" / kCommandFileName).string());
        bool ok = true;
        REQUIRE_NOTHROW(ok = broken.send(StartRecording{1, 2, 3}));
        REQUIRE_FALSE(ok);
    }

    SECTION("EmptyActionRejected") {
        REQUIRE_FALSE(channel.send(CustomCommand{"", {}}));
        REQUIRE_FALSE(fs::exists(file));
    }

    SECTION("NonObjectParamsRejected") {
        REQUIRE_FALSE(channel.send(CustomCommand{"ping", json::array({1, 2})}));
    }

    SECTION("RapidSendsLastWriteWins") {
        for (Snowflake g = 1; g <= 50; ++g) {
            REQUIRE(channel.send(StartRecording{g, g + 1000, 7}));
            REQUIRE(channel.send(StopRecording{g}));
        }
        REQUIRE(channel.send(StartRecording{999, 888, 777}));

        auto j = read_json(file);
        REQUIRE(j["action"] == "start_recording");
        REQUIRE(j["guildId"] == "999");
        REQUIRE(j["channelId"] == "888");
        REQUIRE(j["targetUserId"] == "777");
    }

    SECTION("ConcurrentSendsNeverInterleave") {
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&channel, t] {
                for (int i = 0; i < 25; ++i) {
                    auto g = static_cast<Snowflake>(t * 100 + i + 1);
                    if (i % 2) channel.send(StopRecording{g});
                    else channel.send(StartRecording{g, g, g});
                }
            });
        }
        for (auto& th : threads) th.join();

        // Whatever won must be one complete record.
        auto j = read_json(file);
        REQUIRE(j.is_object());
        if (j["action"] == "start_recording") {
            REQUIRE(j.size() == 5);
            REQUIRE(j["guildId"] == j["channelId"]);
        } else {
            REQUIRE(j["action"] == "stop_recording");
            REQUIRE(j.size() == 3);
        }
    }
}
