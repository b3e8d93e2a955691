#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct Permission {
    std::string_view name;
    uint64_t bit;
};

// Discord permission flags, bits 0..48.
std::span<const Permission> all_permissions();
std::span<const std::string_view> required_permissions();
std::span<const std::string_view> dangerous_permissions();

struct PermissionAnalysis {
    uint64_t value = 0;
    std::vector<std::string> granted;          // sorted by name
    std::vector<std::string> missing_required; // in required order
    std::vector<std::string> dangerous_granted;
    bool is_admin = false;
};

PermissionAnalysis decode_permissions(uint64_t value);

// OR of every required permission.
uint64_t minimal_permissions();

// Decimal or 0x-prefixed hex.
std::expected<uint64_t, std::string> parse_permission_value(std::string_view text);

std::string format_analysis(const PermissionAnalysis& analysis);
