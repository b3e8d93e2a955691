#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/ab_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Server socket is non-blocking, so poll briefly until something other than
// Incomplete comes back.
ReadResult read_with_retry(UnixSocketServer& server, int fd, json& cmd) {
    ReadResult r = ReadResult::Incomplete;
    for (int i = 0; i < 100 && r == ReadResult::Incomplete; ++i) {
        r = server.read_command(fd, cmd);
        if (r == ReadResult::Incomplete) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return r;
}

// Plain socket for writing bytes the client class would never produce.
int raw_connect(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

void raw_send(int fd, const std::string& bytes) {
    REQUIRE(::send(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(bytes.size()));
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        {
            UnixSocketServer server;
            REQUIRE(server.start(sock_path));
            REQUIRE(std::filesystem::exists(sock_path));
            auto perms = std::filesystem::status(sock_path).permissions();
            REQUIRE((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none);
            server.stop();
            REQUIRE_FALSE(std::filesystem::exists(sock_path));
        }
    }

    SECTION("ClientConnects") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("ConnectWithoutServerFails") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect("/tmp/ab_test_ipc_missing.sock"));
        REQUIRE_FALSE(client.send({{"cmd", "status"}}));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        json cmd = {{"cmd", "start"}, {"guild", "111"}, {"channel", "222"}};
        REQUIRE(client.send(cmd));

        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == ReadResult::Command);
        REQUIRE(received["cmd"] == "start");
        REQUIRE(received["guild"] == "111");

        json resp = {{"status", "ok"}, {"message", "start_recording sent"}};
        REQUIRE(server.send_response(client_fd, resp));

        json client_resp;
        REQUIRE(client.recv(client_resp, 1000));
        REQUIRE(client_resp["status"] == "ok");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("MultipleMessages") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            json cmd = {{"cmd", "status"}, {"seq", i}};
            REQUIRE(client.send(cmd));

            json received;
            REQUIRE(read_with_retry(server, client_fd, received) == ReadResult::Command);
            REQUIRE(received["seq"] == i);

            json resp = {{"status", "ok"}, {"seq", i}};
            REQUIRE(server.send_response(client_fd, resp));

            json client_resp;
            REQUIRE(client.recv(client_resp, 1000));
            REQUIRE(client_resp["seq"] == i);
        }

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("TwoLinesInOneWrite") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        raw_send(raw, "{\"cmd\":\"status\"}\n{\"cmd\":\"sessions\"}\n");

        json first, second;
        REQUIRE(read_with_retry(server, client_fd, first) == ReadResult::Command);
        REQUIRE(server.read_command(client_fd, second) == ReadResult::Command);
        REQUIRE(first["cmd"] == "status");
        REQUIRE(second["cmd"] == "sessions");

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("LineSplitAcrossWrites") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        raw_send(raw, "{\"cmd\":\"sta");
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Incomplete);

        raw_send(raw, "tus\"}\n");
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadResult::Command);
        REQUIRE(cmd["cmd"] == "status");

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("MalformedLineKeepsConnection") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        raw_send(raw, "not json\n[1,2]\n{\"cmd\":\"status\"}\n");

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadResult::Malformed);
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Malformed);
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Command);
        REQUIRE(cmd["cmd"] == "status");

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("NonStringCmdIsMalformed") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        raw_send(raw, "{\"cmd\":5}\n{\"cmd\":null}\n{\"guild\":\"1\"}\n{\"cmd\":\"status\"}\n");

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadResult::Malformed);
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Malformed);
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Malformed);
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Command);
        REQUIRE(cmd["cmd"].get<std::string>() == "status");

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ResponseWithInvalidUtf8IsSent") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        json resp = {{"status", "error"}, {"message", std::string("not a decimal id: \xff\xfe")}};
        bool sent = false;
        REQUIRE_NOTHROW(sent = server.send_response(client_fd, resp));
        REQUIRE(sent);

        json client_resp;
        REQUIRE(client.recv(client_resp, 1000));
        REQUIRE(client_resp["status"] == "error");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Closed);

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("UnknownClientIsClosed") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        json cmd;
        REQUIRE(server.read_command(12345, cmd) == ReadResult::Closed);
        server.stop();
    }
}
