#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, Snowflake watched_user, PresenceSource& presence,
                               bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      commands_(config_.ipc.command_path()),
      status_(config_.ipc.status_path(), verbose_),
      presence_(presence),
      core_(watched_user, config_.confirm, commands_, status_, verbose_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (presence_event_fd_ >= 0) ::close(presence_event_fd_);
    if (maintenance_fd_ >= 0) ::close(maintenance_fd_);
}

bool LinuxEventLoop::init() {
    log("Command file: " + commands_.path());
    log("Status file: " + status_.path());
    log_recorder_status();

    // Control socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Session history (optional)
    auto data = platform::data_dir();
    core_.open_history((data.empty() ? std::string("/tmp/archive-bot") : data) + "/sessions.db");

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    presence_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (presence_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    if (config_.maintenance.interval_s > 0) {
        maintenance_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
        if (maintenance_fd_ < 0) {
            std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
            return false;
        }
        itimerspec spec{};
        spec.it_value.tv_sec = config_.maintenance.interval_s;
        spec.it_interval.tv_sec = config_.maintenance.interval_s;
        if (timerfd_settime(maintenance_fd_, 0, &spec, nullptr) < 0) {
            std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
            return false;
        }
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    add_fd(signal_fd_, EPOLLIN);
    add_fd(ipc_server_.server_fd(), EPOLLIN);
    add_fd(presence_event_fd_, EPOLLIN);
    if (maintenance_fd_ >= 0) add_fd(maintenance_fd_, EPOLLIN);

    // Events may arrive as soon as the source starts, so this comes last.
    if (!presence_.start([this](VoiceStateChange change) { enqueue_presence(std::move(change)); })) {
        std::println(stderr, "Failed to start presence source");
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == presence_event_fd_) {
                uint64_t val;
                ::read(presence_event_fd_, &val, sizeof(val));
                drain_presence();
                continue;
            }

            if (fd == maintenance_fd_) {
                uint64_t expirations;
                ::read(maintenance_fd_, &expirations, sizeof(expirations));
                core_.prune_stale_sessions(config_.maintenance.max_session_age());
                continue;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            handle_client(fd);
        }
    }

    presence_.stop();
    core_.shutdown();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::enqueue_presence(VoiceStateChange change) {
    {
        std::lock_guard lock(queue_mu_);
        queue_.push_back(std::move(change));
    }
    uint64_t val = 1;
    if (::write(presence_event_fd_, &val, sizeof(val)) < 0) {
        std::println(stderr, "presence: eventfd write failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::drain_presence() {
    // One event at a time, in arrival order. The orchestrator may sleep for
    // confirmation; later events wait in the queue meanwhile.
    while (true) {
        VoiceStateChange change;
        {
            std::lock_guard lock(queue_mu_);
            if (queue_.empty()) return;
            change = std::move(queue_.front());
            queue_.pop_front();
        }
        core_.handle_voice_state(change);
    }
}

void LinuxEventLoop::handle_client(int fd) {
    while (true) {
        nlohmann::json cmd;
        auto result = ipc_server_.read_command(fd, cmd);

        if (result == ReadResult::Incomplete) return;

        if (result == ReadResult::Closed) {
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
            ipc_server_.close_client(fd);
            return;
        }

        nlohmann::json response;
        if (result == ReadResult::Malformed) {
            response = {{"status", "error"}, {"message", "malformed request"}};
        } else {
            response = core_.handle_command(cmd["cmd"].get<std::string>(), cmd);
        }
        ipc_server_.send_response(fd, response);
    }
}

void LinuxEventLoop::log_recorder_status() {
    if (auto st = status_.read()) {
        log("Recorder status: " + st->status);
    } else {
        std::println(stderr, "Warning: no status from recorder, ensure it is running");
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[archive-bot] {}", msg);
    }
}
