#include <catch2/catch_test_macros.hpp>

#include "voice_state.hpp"

TEST_CASE("Voice state tracker", "[voice_state]") {
    VoiceStateTracker tracker;

    SECTION("FirstSightingIsJoin") {
        auto c = tracker.observe(1, 7, 100);
        REQUIRE(c.guild_id == 1);
        REQUIRE(c.user_id == 7);
        REQUIRE_FALSE(c.before.has_value());
        REQUIRE(c.after == 100u);
        REQUIRE(tracker.channel_of(1, 7) == 100u);
    }

    SECTION("ChannelChangeIsMove") {
        tracker.observe(1, 7, 100);
        auto c = tracker.observe(1, 7, 200);
        REQUIRE(c.before == 100u);
        REQUIRE(c.after == 200u);
    }

    SECTION("ZeroChannelIsLeave") {
        tracker.observe(1, 7, 100);
        auto c = tracker.observe(1, 7, 0);
        REQUIRE(c.before == 100u);
        REQUIRE_FALSE(c.after.has_value());
        REQUIRE_FALSE(tracker.channel_of(1, 7).has_value());
        REQUIRE(tracker.size() == 0);
    }

    SECTION("SameChannelRepeats") {
        // Mute and deafen updates carry the same channel.
        tracker.observe(1, 7, 100);
        auto c = tracker.observe(1, 7, 100);
        REQUIRE(c.before == c.after);
    }

    SECTION("LeaveWithoutJoinHasNoChannels") {
        auto c = tracker.observe(1, 7, 0);
        REQUIRE_FALSE(c.before.has_value());
        REQUIRE_FALSE(c.after.has_value());
    }

    SECTION("GuildsTrackedSeparately") {
        tracker.observe(1, 7, 100);
        auto c = tracker.observe(2, 7, 300);
        REQUIRE_FALSE(c.before.has_value());
        REQUIRE(tracker.channel_of(1, 7) == 100u);
        REQUIRE(tracker.size() == 2);
    }
}

TEST_CASE("Voice state seeding", "[voice_state]") {
    VoiceStateTracker tracker;

    SECTION("SeededLeaveHasBeforeChannel") {
        tracker.seed({.guild_id = 1, .members = {{7, 100}, {8, 200}}});
        REQUIRE(tracker.channel_of(1, 7) == 100u);

        auto c = tracker.observe(1, 7, 0);
        REQUIRE(c.before == 100u);
        REQUIRE_FALSE(c.after.has_value());
    }

    SECTION("SeededMoveHasBothChannels") {
        tracker.seed({.guild_id = 1, .members = {{7, 100}}});
        auto c = tracker.observe(1, 7, 300);
        REQUIRE(c.before == 100u);
        REQUIRE(c.after == 300u);
    }

    SECTION("SeedReplacesOnlyThatGuild") {
        tracker.observe(1, 7, 100);
        tracker.observe(1, 8, 100);
        tracker.observe(2, 7, 500);

        tracker.seed({.guild_id = 1, .members = {{8, 101}}});
        REQUIRE_FALSE(tracker.channel_of(1, 7).has_value());
        REQUIRE(tracker.channel_of(1, 8) == 101u);
        REQUIRE(tracker.channel_of(2, 7) == 500u);
    }
}

TEST_CASE("Guild voice state payload", "[voice_state]") {

    SECTION("GatewayDispatch") {
        auto snap = parse_guild_voice_states(R"({
            "op": 0, "t": "GUILD_CREATE", "s": 2,
            "d": {
                "id": "111",
                "name": "home",
                "voice_states": [
                    {"user_id": "333", "channel_id": "222", "self_mute": false},
                    {"user_id": "444", "channel_id": null},
                    {"user_id": "555", "channel_id": "223"}
                ]
            }
        })");
        REQUIRE(snap.has_value());
        REQUIRE(snap->guild_id == 111);
        REQUIRE(snap->members.size() == 2);
        REQUIRE(snap->members[0].user_id == 333);
        REQUIRE(snap->members[0].channel_id == 222);
        REQUIRE(snap->members[1].user_id == 555);
    }

    SECTION("BareGuildObject") {
        auto snap = parse_guild_voice_states(R"({"id": "9", "voice_states": []})");
        REQUIRE(snap.has_value());
        REQUIRE(snap->guild_id == 9);
        REQUIRE(snap->members.empty());
    }

    SECTION("NoVoiceStatesMeansEmptyGuild") {
        auto snap = parse_guild_voice_states(R"({"d": {"id": "9"}})");
        REQUIRE(snap.has_value());
        REQUIRE(snap->members.empty());
    }

    SECTION("Rejected") {
        REQUIRE_FALSE(parse_guild_voice_states("").has_value());
        REQUIRE_FALSE(parse_guild_voice_states("not json").has_value());
        REQUIRE_FALSE(parse_guild_voice_states(R"({"d": {"name": "no id"}})").has_value());
        REQUIRE_FALSE(parse_guild_voice_states(R"({"d": {"id": "abc"}})").has_value());
    }
}
