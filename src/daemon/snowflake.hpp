#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

// Discord IDs. Always carried as uint64_t in memory and as decimal strings on
// the wire, since some JSON consumers lose precision above 2^53.
using Snowflake = uint64_t;

std::expected<Snowflake, std::string> parse_snowflake(std::string_view text);

inline std::string to_wire(Snowflake id) {
    return std::to_string(id);
}
