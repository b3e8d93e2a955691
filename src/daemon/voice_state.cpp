#include "voice_state.hpp"

#include <nlohmann/json.hpp>

namespace {

// Discord sends ids as strings; numbers are tolerated.
std::optional<Snowflake> id_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_number_unsigned()) return it->get<Snowflake>();
    if (!it->is_string()) return std::nullopt;
    auto id = parse_snowflake(it->get<std::string>());
    return id ? std::optional<Snowflake>(*id) : std::nullopt;
}

} // namespace

std::optional<GuildVoiceSnapshot> parse_guild_voice_states(std::string_view payload) {
    auto doc = nlohmann::json::parse(payload, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;
    if (auto d = doc.find("d"); d != doc.end() && d->is_object()) doc = *d;

    auto guild_id = id_field(doc, "id");
    if (!guild_id) return std::nullopt;

    GuildVoiceSnapshot snapshot{.guild_id = *guild_id, .members = {}};
    auto states = doc.find("voice_states");
    if (states == doc.end() || !states->is_array()) return snapshot;

    for (auto& vs : *states) {
        if (!vs.is_object()) continue;
        auto user = id_field(vs, "user_id");
        auto channel = id_field(vs, "channel_id");
        if (user && channel) snapshot.members.push_back({*user, *channel});
    }
    return snapshot;
}

VoiceStateChange VoiceStateTracker::observe(Snowflake guild_id, Snowflake user_id,
                                            Snowflake channel_id) {
    VoiceStateChange change;
    change.guild_id = guild_id;
    change.user_id = user_id;
    change.before = channel_of(guild_id, user_id);

    auto key = std::make_pair(guild_id, user_id);
    if (channel_id != 0) {
        change.after = channel_id;
        channels_[key] = channel_id;
    } else {
        channels_.erase(key);
    }
    return change;
}

std::optional<Snowflake> VoiceStateTracker::channel_of(Snowflake guild_id, Snowflake user_id) const {
    auto it = channels_.find({guild_id, user_id});
    if (it == channels_.end()) return std::nullopt;
    return it->second;
}

void VoiceStateTracker::seed(const GuildVoiceSnapshot& snapshot) {
    std::erase_if(channels_, [&](const auto& entry) { return entry.first.first == snapshot.guild_id; });
    for (auto& m : snapshot.members) {
        channels_[{snapshot.guild_id, m.user_id}] = m.channel_id;
    }
}
