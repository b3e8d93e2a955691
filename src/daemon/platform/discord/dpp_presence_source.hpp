#pragma once

#include "platform/presence_source.hpp"
#include "voice_state.hpp"

#include <dpp/dpp.h>

#include <memory>
#include <mutex>
#include <string>

// Discord gateway connection via D++. Only the voice-state intent is used;
// message content and presences stay disabled.
class DppPresenceSource : public PresenceSource {
public:
    DppPresenceSource(std::string token, bool verbose = false);
    ~DppPresenceSource() override;

    DppPresenceSource(const DppPresenceSource&) = delete;
    DppPresenceSource& operator=(const DppPresenceSource&) = delete;

    bool start(Callback on_change) override;
    void stop() override;

private:
    void on_voice_state(const dpp::voice_state_update_t& event);
    void on_guild_create(const dpp::guild_create_t& event);
    void on_log(const dpp::log_t& event);

    static std::string channel_name(Snowflake channel_id);
    static std::string user_name(Snowflake user_id);

    std::string token_;
    bool verbose_;
    Callback on_change_;

    std::unique_ptr<dpp::cluster> cluster_;

    std::mutex tracker_mu_;
    VoiceStateTracker tracker_;
};
