#pragma once

#include "channel/file_command_channel.hpp"
#include "channel/file_status_channel.hpp"
#include "config.hpp"
#include "orchestrator.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/presence_source.hpp"

#include <atomic>
#include <deque>
#include <mutex>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, Snowflake watched_user, PresenceSource& presence,
                   bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    // Called on the presence source's thread.
    void enqueue_presence(VoiceStateChange change);
    void drain_presence();
    void handle_client(int fd);
    void log_recorder_status();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    FileCommandChannel commands_;
    FileStatusChannel status_;
    UnixSocketServer ipc_server_;
    PresenceSource& presence_;

    // Portable business logic
    Orchestrator core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int presence_event_fd_ = -1;
    int maintenance_fd_ = -1;

    std::mutex queue_mu_;
    std::deque<VoiceStateChange> queue_;

    std::atomic<bool> running_{false};
};
