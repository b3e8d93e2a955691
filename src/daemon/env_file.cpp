#include "env_file.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <fstream>
#include <string_view>

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string_view unquote(std::string_view s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

} // namespace

std::expected<size_t, std::string> load_env_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected(std::format("cannot open {}: {}", path, std::strerror(errno)));
    }

    size_t count = 0;
    std::string line;
    while (std::getline(f, line)) {
        auto s = trim(line);
        if (s.empty() || s.front() == '#') continue;
        if (s.starts_with("export ")) s = trim(s.substr(7));

        auto eq = s.find('=');
        if (eq == std::string_view::npos) continue;

        std::string key(trim(s.substr(0, eq)));
        std::string value(unquote(trim(s.substr(eq + 1))));
        if (key.empty()) continue;
        if (std::getenv(key.c_str())) continue;

        if (::setenv(key.c_str(), value.c_str(), 0) == 0) ++count;
    }
    return count;
}
