#include "permissions.hpp"

#include <print>
#include <string>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::println("Discord Permissions Decoder");
        std::println("{}", std::string(30, '='));
        std::println("Usage: {} <permission_integer>", argv[0]);
        std::println("");
        std::println("Example:");
        std::println("  {} 1125899941448832", argv[0]);
        std::println("");
        auto minimal = minimal_permissions();
        std::println("Minimal permissions needed for audio bot: {}", minimal);
        std::println("Minimal permissions hex: {:#x}", minimal);
        return 0;
    }

    auto value = parse_permission_value(argv[1]);
    if (!value) {
        std::println(stderr, "Error: {}", value.error());
        std::println(stderr, "Please provide a valid integer or hex value (e.g., 0x1234)");
        return 1;
    }

    auto analysis = decode_permissions(*value);
    std::print("{}", format_analysis(analysis));

    std::println("");
    std::println("{}", std::string(60, '='));
    std::println("SECURITY RECOMMENDATIONS:");
    std::println("{}", std::string(60, '='));

    if (analysis.is_admin) {
        std::println("CRITICAL: Remove Administrator permission!");
        std::println("   This grants ALL permissions and is a security risk.");
    }
    if (!analysis.dangerous_granted.empty()) {
        std::println("WARNING: Remove dangerous permissions listed above.");
        std::println("   Grant only the minimum permissions needed.");
    }
    if (analysis.missing_required.empty()) {
        std::println("All required permissions are granted.");
    } else {
        std::println("Missing required permissions - bot may not function properly.");
    }

    std::println("\nRecommended minimal permissions: {}", minimal_permissions());
    return 0;
}
