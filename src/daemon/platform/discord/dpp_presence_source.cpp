#include "platform/discord/dpp_presence_source.hpp"

#include <print>

DppPresenceSource::DppPresenceSource(std::string token, bool verbose)
    : token_(std::move(token)), verbose_(verbose) {}

DppPresenceSource::~DppPresenceSource() {
    stop();
}

bool DppPresenceSource::start(Callback on_change) {
    on_change_ = std::move(on_change);

    try {
        cluster_ = std::make_unique<dpp::cluster>(token_, dpp::i_guilds | dpp::i_guild_voice_states);
    } catch (const dpp::exception& e) {
        std::println(stderr, "discord: failed to create client: {}", e.what());
        return false;
    }

    cluster_->on_log([this](const dpp::log_t& event) { on_log(event); });

    cluster_->on_ready([this](const dpp::ready_t& /*event*/) {
        if (verbose_) {
            std::println(stderr, "[archive-bot] Logged in as {}", cluster_->me.username);
            std::println(stderr, "[archive-bot] Monitoring voice state changes...");
        }
    });

    // Guild snapshots carry who is already in voice, so a leave or move of a
    // member seen before this process started is still recognised.
    cluster_->on_guild_create([this](const dpp::guild_create_t& event) {
        on_guild_create(event);
    });

    cluster_->on_voice_state_update([this](const dpp::voice_state_update_t& event) {
        on_voice_state(event);
    });

    try {
        cluster_->start(dpp::st_return);
    } catch (const dpp::exception& e) {
        std::println(stderr, "discord: failed to connect: {}", e.what());
        cluster_.reset();
        return false;
    }
    return true;
}

void DppPresenceSource::stop() {
    if (!cluster_) return;
    cluster_->shutdown();
    cluster_.reset();
}

void DppPresenceSource::on_voice_state(const dpp::voice_state_update_t& event) {
    const auto& vs = event.state;

    VoiceStateChange change;
    {
        std::lock_guard lock(tracker_mu_);
        change = tracker_.observe(vs.guild_id, vs.user_id, vs.channel_id);
    }

    Snowflake shown = change.after ? *change.after : change.before.value_or(0);
    change.channel_name = shown ? channel_name(shown) : std::string();
    change.user_name = user_name(change.user_id);

    if (on_change_) on_change_(std::move(change));
}

void DppPresenceSource::on_guild_create(const dpp::guild_create_t& event) {
    auto snapshot = parse_guild_voice_states(event.raw_event);
    if (!snapshot) {
        std::println(stderr, "discord: could not read voice states from guild snapshot");
        return;
    }

    {
        std::lock_guard lock(tracker_mu_);
        tracker_.seed(*snapshot);
    }
    if (verbose_) {
        std::println(stderr, "[archive-bot] Guild {}: {} members in voice", snapshot->guild_id,
                     snapshot->members.size());
    }
}

void DppPresenceSource::on_log(const dpp::log_t& event) {
    if (event.severity >= dpp::ll_warning) {
        std::println(stderr, "discord: {}", event.message);
    } else if (verbose_ && event.severity >= dpp::ll_info) {
        std::println(stderr, "[archive-bot] discord: {}", event.message);
    }
}

std::string DppPresenceSource::channel_name(Snowflake channel_id) {
    if (auto* ch = dpp::find_channel(channel_id)) return ch->name;
    return to_wire(channel_id);
}

std::string DppPresenceSource::user_name(Snowflake user_id) {
    if (auto* u = dpp::find_user(user_id)) return u->username;
    return to_wire(user_id);
}
