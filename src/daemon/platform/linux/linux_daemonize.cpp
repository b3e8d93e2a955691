#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <print>
#include <unistd.h>

namespace platform {

void daemonize(const std::string& log_path) {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    setsid();

    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    freopen("/dev/null", "r", stdin);
    freopen("/dev/null", "w", stdout);
    if (log_path.empty() || !freopen(log_path.c_str(), "a", stderr)) {
        freopen("/dev/null", "w", stderr);
    } else {
        setvbuf(stderr, nullptr, _IOLBF, 0);
    }
}

} // namespace platform
