#pragma once

#include "snowflake.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// One voice-state change of one member. An empty channel means "not in voice".
struct VoiceStateChange {
    Snowflake user_id = 0;
    Snowflake guild_id = 0;
    std::optional<Snowflake> before;
    std::optional<Snowflake> after;
    std::string channel_name;
    std::string user_name;
};

struct VoiceMember {
    Snowflake user_id = 0;
    Snowflake channel_id = 0;
};

// Who sits in which voice channel of one guild at connect time.
struct GuildVoiceSnapshot {
    Snowflake guild_id = 0;
    std::vector<VoiceMember> members;
};

// Reads the voice_states of a GUILD_CREATE dispatch. Accepts the full gateway
// payload or just its "d" object. Entries without a channel are skipped.
std::optional<GuildVoiceSnapshot> parse_guild_voice_states(std::string_view payload);

// Gateway voice-state updates only carry the new channel. The tracker keeps the
// last channel per (guild, user) so that each update can be turned into a
// before/after pair.
class VoiceStateTracker {
public:
    // channel_id == 0 means the member left voice in that guild.
    VoiceStateChange observe(Snowflake guild_id, Snowflake user_id, Snowflake channel_id);

    // Replaces what is known about one guild. Produces no changes, so a member
    // already in voice is neither joined nor left by seeding.
    void seed(const GuildVoiceSnapshot& snapshot);

    std::optional<Snowflake> channel_of(Snowflake guild_id, Snowflake user_id) const;
    size_t size() const { return channels_.size(); }

private:
    std::map<std::pair<Snowflake, Snowflake>, Snowflake> channels_;
};
