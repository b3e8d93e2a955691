#pragma once

#include "voice_state.hpp"

#include <functional>

// Delivers voice-state changes from the chat platform. The callback may be
// invoked from a thread owned by the implementation.
class PresenceSource {
public:
    using Callback = std::function<void(VoiceStateChange)>;

    virtual ~PresenceSource() = default;
    virtual bool start(Callback on_change) = 0;
    virtual void stop() = 0;
};
