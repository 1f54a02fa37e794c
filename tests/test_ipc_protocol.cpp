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
using ReadStatus = IpcServer::ReadStatus;

namespace {

std::string tmp_socket_path() {
    return "/tmp/aw_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Server sockets are non-blocking; poll until a line arrives.
ReadStatus read_with_retry(UnixSocketServer& server, int client_fd, json& cmd) {
    auto status = ReadStatus::Pending;
    for (int i = 0; i < 200 && status == ReadStatus::Pending; ++i) {
        status = server.read_command(client_fd, cmd);
        if (status == ReadStatus::Pending) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return status;
}

int connect_raw(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

int accept_with_retry(UnixSocketServer& server) {
    for (int i = 0; i < 200; ++i) {
        int fd = server.accept_client();
        if (fd >= 0) return fd;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return -1;
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("SecondInstanceRefused") {
        UnixSocketServer first;
        REQUIRE(first.start(sock_path));

        UnixSocketServer second;
        REQUIRE_FALSE(second.start(sock_path));
        // The refused server must not remove the live socket.
        second.stop();
        REQUIRE(std::filesystem::exists(sock_path));

        first.stop();
    }

    SECTION("StaleSocketReplaced") {
        {
            // Bound but never listening: connect() is refused like a crashed daemon's.
            int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
            sockaddr_un addr{};
            addr.sun_family = AF_UNIX;
            std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
            ::unlink(sock_path.c_str());
            REQUIRE(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
            ::close(fd);
        }
        REQUIRE(std::filesystem::exists(sock_path));

        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        server.stop();
    }

    SECTION("ConnectWithoutServerFails") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect("/tmp/aw_test_ipc_nobody_listening.sock"));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "sessions"}}));

        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == ReadStatus::Message);
        REQUIRE(received["cmd"] == "sessions");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"waiting_count", 2}}));

        json client_resp;
        REQUIRE(client.recv(client_resp, 1000));
        REQUIRE(client_resp["status"] == "ok");
        REQUIRE(client_resp["waiting_count"] == 2);

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("MultipleRequests") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"cmd", "status"}, {"seq", i}}));

            json received;
            REQUIRE(read_with_retry(server, client_fd, received) == ReadStatus::Message);
            REQUIRE(received["seq"] == i);

            REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"seq", i}}));

            json client_resp;
            REQUIRE(client.recv(client_resp, 1000));
            REQUIRE(client_resp["seq"] == i);
        }

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("PipelinedLinesReadOneAtATime") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "notes"}}));
        REQUIRE(client.send({{"cmd", "windows"}}));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        json first, second;
        REQUIRE(read_with_retry(server, client_fd, first) == ReadStatus::Message);
        REQUIRE(read_with_retry(server, client_fd, second) == ReadStatus::Message);
        REQUIRE(first["cmd"] == "notes");
        REQUIRE(second["cmd"] == "windows");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("MalformedLineReported") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        // Raw connection so arbitrary bytes can go on the wire.
        int raw = connect_raw(sock_path);
        REQUIRE(raw >= 0);

        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        std::string bytes = "not json\n{\"cmd\":\"status\"}\n";
        REQUIRE(::send(raw, bytes.data(), bytes.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(bytes.size()));

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Malformed);
        // The connection stays usable after a bad line.
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Message);
        REQUIRE(cmd["cmd"] == "status");

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        client.close();

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Closed);

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("RecvTimesOut") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        json resp;
        REQUIRE_FALSE(client.recv(resp, 20));

        client.close();
        server.stop();
    }
}
