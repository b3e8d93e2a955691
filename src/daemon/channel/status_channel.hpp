#pragma once

#include "status.hpp"

#include <optional>

// Consumer side of the recorder protocol. Missing, unreadable and corrupt
// status all read as std::nullopt.
class StatusChannel {
public:
    virtual ~StatusChannel() = default;
    virtual std::optional<Status> read() = 0;
};
