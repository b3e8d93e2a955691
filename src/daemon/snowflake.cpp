#include "snowflake.hpp"

#include <charconv>
#include <format>

std::expected<Snowflake, std::string> parse_snowflake(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);

    if (text.empty()) {
        return std::unexpected("empty id");
    }

    Snowflake value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return std::unexpected(std::format("id out of range: {}", text));
    }
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(std::format("not a decimal id: {}", text));
    }
    if (value == 0) {
        return std::unexpected("id must be non-zero");
    }
    return value;
}
