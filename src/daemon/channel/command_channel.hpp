#pragma once

#include "command.hpp"

// Producer side of the recorder protocol. Implementations never throw; a
// failed delivery is reported through the return value only.
class CommandChannel {
public:
    virtual ~CommandChannel() = default;
    virtual bool send(const Command& cmd) = 0;
};
