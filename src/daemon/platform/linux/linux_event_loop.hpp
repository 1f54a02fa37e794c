#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/procfs_detector.hpp"
#include "platform/linux/sway_window_manager.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <atomic>
#include <string>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    // Bind the IPC socket. Call before daemonizing so a refused start is
    // still reported on the caller's terminal and exit status.
    bool listen(const std::string& endpoint);
    bool init();
    void run();
    void request_stop();

private:
    // Answer every complete request buffered for fd; false once the client is gone.
    bool serve_client(int fd);
    void drop_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    SwayWindowManager window_mgr_;
    ProcfsDetector detector_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};
