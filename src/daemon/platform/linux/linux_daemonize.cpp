#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <unistd.h>

namespace platform {

namespace {

// Fork and let the parent exit; the child carries on.
void fork_and_detach(const char* stage) {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "daemon: {} fork failed: {}", stage, std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);
}

} // namespace

bool daemonize() {
    fork_and_detach("first");

    if (setsid() < 0) {
        std::println(stderr, "daemon: setsid failed: {}", std::strerror(errno));
        _exit(1);
    }

    // Second fork: the session leader exits so no terminal can be reacquired.
    fork_and_detach("second");

    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0) return false;

    bool ok = true;
    for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        if (::dup2(null_fd, fd) < 0) ok = false;
    }
    if (null_fd > STDERR_FILENO) ::close(null_fd);
    return ok;
}

} // namespace platform
