#include "platform/linux/linux_event_loop.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      detector_(config_.agents),
      core_(config_, verbose_, detector_, window_mgr_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxEventLoop::listen(const std::string& endpoint) {
    if (!ipc_server_.start(endpoint)) return false;
    log("IPC listening on " + endpoint);
    return true;
}

bool LinuxEventLoop::init() {
    if (ipc_server_.server_fd() < 0) {
        std::println(stderr, "ipc: init() called before listen()");
        return false;
    }
    log("Watching " + config_.scanner.projects_dir);

    // Window manager (optional)
    if (window_mgr_.connect()) {
        log("Sway IPC connected");
    } else {
        log("Sway IPC not available (window commands disabled)");
    }

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
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

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
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
                if (::read(signal_fd_, &info, sizeof(info)) < 0) continue;
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (!serve_client(fd)) drop_client(fd);
        }
    }

    ipc_server_.stop();
}

bool LinuxEventLoop::serve_client(int fd) {
    while (true) {
        nlohmann::json cmd;
        switch (ipc_server_.read_command(fd, cmd)) {
            case IpcServer::ReadStatus::Pending:
                return true;
            case IpcServer::ReadStatus::Closed:
                return false;
            case IpcServer::ReadStatus::Malformed:
                if (!ipc_server_.send_response(fd, {{"status", "error"}, {"message", "invalid JSON"}}))
                    return false;
                continue;
            case IpcServer::ReadStatus::Message:
                break;
        }

        nlohmann::json response;
        if (!cmd.is_object()) {
            response = {{"status", "error"}, {"message", "request must be a JSON object"}};
        } else {
            auto cmd_it = cmd.find("cmd");
            std::string cmd_str = cmd_it != cmd.end() && cmd_it->is_string() ? cmd_it->get<std::string>() : "";
            response = core_.handle_command(cmd_str, cmd);
        }

        if (!ipc_server_.send_response(fd, response)) return false;
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[agent-watch] {}", msg);
    }
}
