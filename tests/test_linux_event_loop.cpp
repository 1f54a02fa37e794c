#include <catch2/catch_test_macros.hpp>

#include "platform/linux/linux_event_loop.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

std::string tmp_socket_path() {
    return "/tmp/aw_test_loop_" + std::to_string(getpid()) + ".sock";
}

Config test_config() {
    Config cfg;
    cfg.scanner.projects_dir = "/tmp/aw_test_loop_no_projects";
    cfg.notes.path = "/tmp/aw_test_loop_notes.md";
    return cfg;
}

} // namespace

TEST_CASE("LinuxEventLoop", "[daemon][loop]") {
    auto sock_path = tmp_socket_path();

    SECTION("ListenBindsEndpoint") {
        {
            LinuxEventLoop loop(test_config());
            REQUIRE(loop.listen(sock_path));
            REQUIRE(std::filesystem::exists(sock_path));
        }
        // Destruction closes and removes the socket.
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("SecondInstanceRefusedAtListen") {
        UnixSocketServer running;
        REQUIRE(running.start(sock_path));

        LinuxEventLoop loop(test_config());
        REQUIRE_FALSE(loop.listen(sock_path));
        // Nothing past listen() may run without the socket.
        REQUIRE_FALSE(loop.init());
        REQUIRE(std::filesystem::exists(sock_path));

        running.stop();
    }
}
