#include <catch2/catch_test_macros.hpp>

#include "command.hpp"
#include "snowflake.hpp"

#include <chrono>
#include <nlohmann/json.hpp>

using namespace std::chrono;

TEST_CASE("Snowflake parsing", "[command]") {

    SECTION("Decimal") {
        auto id = parse_snowflake("123456789012345678");
        REQUIRE(id.has_value());
        REQUIRE(*id == 123456789012345678ULL);
    }

    SECTION("SurroundingWhitespace") {
        REQUIRE(parse_snowflake("  42\t").value() == 42);
    }

    SECTION("MaxValue") {
        REQUIRE(parse_snowflake("18446744073709551615").value() == UINT64_MAX);
    }

    SECTION("Rejected") {
        REQUIRE_FALSE(parse_snowflake("").has_value());
        REQUIRE_FALSE(parse_snowflake("abc").has_value());
        REQUIRE_FALSE(parse_snowflake("12x").has_value());
        REQUIRE_FALSE(parse_snowflake("-5").has_value());
        REQUIRE_FALSE(parse_snowflake("0").has_value());
        REQUIRE_FALSE(parse_snowflake("18446744073709551616").has_value());
    }
}

TEST_CASE("Command records", "[command]") {
    auto now = sys_days{2024y / 1 / 2} + 3h + 4min + 5s + 6us;

    SECTION("ActionNames") {
        REQUIRE(action_name(StartRecording{1, 2, 3}) == "start_recording");
        REQUIRE(action_name(StopRecording{1}) == "stop_recording");
        REQUIRE(action_name(CustomCommand{"ping", {}}) == "ping");
    }

    SECTION("TimestampFormat") {
        REQUIRE(iso_timestamp(now) == "2024-01-02T03:04:05.000006Z");
    }

    SECTION("StartRecordingFields") {
        auto j = to_record(StartRecording{111, 222, 333}, now);
        REQUIRE(j.size() == 5);
        REQUIRE(j["action"] == "start_recording");
        REQUIRE(j["timestamp"] == "2024-01-02T03:04:05.000006Z");
        REQUIRE(j["guildId"] == "111");
        REQUIRE(j["channelId"] == "222");
        REQUIRE(j["targetUserId"] == "333");
    }

    SECTION("StopRecordingFields") {
        auto j = to_record(StopRecording{111}, now);
        REQUIRE(j.size() == 3);
        REQUIRE(j["action"] == "stop_recording");
        REQUIRE(j["guildId"] == "111");
    }

    SECTION("LargeIdsStayStrings") {
        auto j = to_record(StopRecording{18446744073709551615ULL}, now);
        REQUIRE(j["guildId"].is_string());
        REQUIRE(j["guildId"] == "18446744073709551615");
    }

    SECTION("CustomParamsMerged") {
        CustomCommand c{"set_bitrate", {{"guildId", "9"}, {"bitrate", 64000}}};
        auto j = to_record(c, now);
        REQUIRE(j["action"] == "set_bitrate");
        REQUIRE(j["guildId"] == "9");
        REQUIRE(j["bitrate"] == 64000);
    }

    SECTION("CustomParamsCannotOverrideActionOrTimestamp") {
        CustomCommand c{"ping", {{"action", "start_recording"}, {"timestamp", "yesterday"}}};
        auto j = to_record(c, now);
        REQUIRE(j["action"] == "ping");
        REQUIRE(j["timestamp"] == "2024-01-02T03:04:05.000006Z");
    }
}
