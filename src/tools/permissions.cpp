#include "permissions.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <format>

namespace {

constexpr std::array<Permission, 49> kPermissions = {{
    {"CREATE_INSTANT_INVITE", 1ULL << 0},
    {"KICK_MEMBERS", 1ULL << 1},
    {"BAN_MEMBERS", 1ULL << 2},
    {"ADMINISTRATOR", 1ULL << 3},
    {"MANAGE_CHANNELS", 1ULL << 4},
    {"MANAGE_GUILD", 1ULL << 5},
    {"ADD_REACTIONS", 1ULL << 6},
    {"VIEW_AUDIT_LOG", 1ULL << 7},
    {"PRIORITY_SPEAKER", 1ULL << 8},
    {"STREAM", 1ULL << 9},
    {"VIEW_CHANNEL", 1ULL << 10},
    {"SEND_MESSAGES", 1ULL << 11},
    {"SEND_TTS_MESSAGES", 1ULL << 12},
    {"MANAGE_MESSAGES", 1ULL << 13},
    {"EMBED_LINKS", 1ULL << 14},
    {"ATTACH_FILES", 1ULL << 15},
    {"READ_MESSAGE_HISTORY", 1ULL << 16},
    {"MENTION_EVERYONE", 1ULL << 17},
    {"USE_EXTERNAL_EMOJIS", 1ULL << 18},
    {"VIEW_GUILD_INSIGHTS", 1ULL << 19},
    {"CONNECT", 1ULL << 20},
    {"SPEAK", 1ULL << 21},
    {"MUTE_MEMBERS", 1ULL << 22},
    {"DEAFEN_MEMBERS", 1ULL << 23},
    {"MOVE_MEMBERS", 1ULL << 24},
    {"USE_VAD", 1ULL << 25},
    {"CHANGE_NICKNAME", 1ULL << 26},
    {"MANAGE_NICKNAMES", 1ULL << 27},
    {"MANAGE_ROLES", 1ULL << 28},
    {"MANAGE_WEBHOOKS", 1ULL << 29},
    {"MANAGE_EMOJIS_AND_STICKERS", 1ULL << 30},
    {"USE_APPLICATION_COMMANDS", 1ULL << 31},
    {"REQUEST_TO_SPEAK", 1ULL << 32},
    {"MANAGE_EVENTS", 1ULL << 33},
    {"MANAGE_THREADS", 1ULL << 34},
    {"CREATE_PUBLIC_THREADS", 1ULL << 35},
    {"CREATE_PRIVATE_THREADS", 1ULL << 36},
    {"USE_EXTERNAL_STICKERS", 1ULL << 37},
    {"SEND_MESSAGES_IN_THREADS", 1ULL << 38},
    {"USE_EMBEDDED_ACTIVITIES", 1ULL << 39},
    {"MODERATE_MEMBERS", 1ULL << 40},
    {"VIEW_CREATOR_MONETIZATION_ANALYTICS", 1ULL << 41},
    {"USE_SOUNDBOARD", 1ULL << 42},
    {"CREATE_EXPRESSIONS", 1ULL << 43},
    {"CREATE_EVENTS", 1ULL << 44},
    {"USE_EXTERNAL_SOUNDS", 1ULL << 45},
    {"SEND_VOICE_MESSAGES", 1ULL << 46},
    {"SEND_POLLS", 1ULL << 47},
    {"USE_EXTERNAL_APPS", 1ULL << 48},
}};

constexpr std::array<std::string_view, 5> kRequired = {
    "VIEW_CHANNEL", "CONNECT", "SPEAK", "USE_VAD", "READ_MESSAGE_HISTORY",
};

constexpr std::array<std::string_view, 6> kDangerous = {
    "ADMINISTRATOR", "MANAGE_GUILD", "BAN_MEMBERS", "KICK_MEMBERS", "MANAGE_ROLES", "MANAGE_CHANNELS",
};

bool contains(std::span<const std::string_view> set, std::string_view name) {
    return std::ranges::find(set, name) != set.end();
}

bool contains(const std::vector<std::string>& set, std::string_view name) {
    return std::ranges::find(set, name) != set.end();
}

} // namespace

std::span<const Permission> all_permissions() { return kPermissions; }
std::span<const std::string_view> required_permissions() { return kRequired; }
std::span<const std::string_view> dangerous_permissions() { return kDangerous; }

PermissionAnalysis decode_permissions(uint64_t value) {
    PermissionAnalysis a;
    a.value = value;

    for (auto& p : kPermissions) {
        if (!(value & p.bit)) continue;
        a.granted.emplace_back(p.name);
        if (contains(kDangerous, p.name)) a.dangerous_granted.emplace_back(p.name);
    }
    for (auto name : kRequired) {
        if (!contains(a.granted, name)) a.missing_required.emplace_back(name);
    }

    a.is_admin = contains(a.granted, "ADMINISTRATOR");
    std::ranges::sort(a.granted);
    return a;
}

uint64_t minimal_permissions() {
    uint64_t minimal = 0;
    for (auto& p : kPermissions) {
        if (contains(kRequired, p.name)) minimal |= p.bit;
    }
    return minimal;
}

std::expected<uint64_t, std::string> parse_permission_value(std::string_view text) {
    int base = 10;
    auto digits = text;
    if (digits.starts_with("0x") || digits.starts_with("0X")) {
        base = 16;
        digits.remove_prefix(2);
    }
    if (digits.empty()) {
        return std::unexpected(std::format("invalid permission integer '{}'", text));
    }

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::unexpected(std::format("invalid permission integer '{}'", text));
    }
    return value;
}

std::string format_analysis(const PermissionAnalysis& a) {
    const std::string rule(60, '=');
    const std::string thin(40, '-');
    std::string out;
    auto line = [&out](std::string_view s) {
        out += s;
        out += '\n';
    };

    line(rule);
    line("DISCORD BOT PERMISSION ANALYSIS");
    line(rule);
    line("");
    line(std::format("Permission Integer: {}", a.value));
    line(std::format("Permission Hex: {:#x}", a.value));
    line(std::format("Total Permissions: {}", a.granted.size()));
    line(std::format("Administrator: {}", a.is_admin ? "YES - DANGEROUS!" : "No"));
    line("");

    line("REQUIRED PERMISSIONS FOR AUDIO BOT:");
    line(thin);
    for (auto name : kRequired) {
        line(std::format("{:<25} {}", name, contains(a.missing_required, name) ? "MISSING" : "GRANTED"));
    }
    line("");

    if (!a.missing_required.empty()) {
        line("MISSING REQUIRED PERMISSIONS:");
        for (auto& name : a.missing_required) line("  - " + name);
        line("");
    }

    if (!a.dangerous_granted.empty()) {
        line("DANGEROUS PERMISSIONS GRANTED:");
        line("Consider removing these for security:");
        for (auto& name : a.dangerous_granted) line("  - " + name);
        line("");
    }

    line("ALL GRANTED PERMISSIONS:");
    line(thin);
    int i = 1;
    for (auto& name : a.granted) {
        const char* marker = contains(kDangerous, name) ? "!!" : contains(kRequired, name) ? "ok" : "  ";
        line(std::format("{:2d}. {} {}", i++, marker, name));
    }
    line("");
    line("LEGEND:");
    line("ok = Required for audio bot functionality");
    line("!! = Potentially dangerous permission");
    line("   = Optional/unnecessary permission");
    return out;
}
