#include "platform/linux/sway_window_manager.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

SwayWindowManager::SwayWindowManager() = default;

SwayWindowManager::~SwayWindowManager() {
    disconnect();
}

bool SwayWindowManager::connect() {
    const char* sock = std::getenv("SWAYSOCK");
    if (!sock) {
        std::println(stderr, "sway: $SWAYSOCK not set");
        return false;
    }
    sway_sock_ = sock;

    query_fd_ = connect_socket(sway_sock_);
    return query_fd_ >= 0;
}

std::vector<WindowInfo> SwayWindowManager::list_windows() {
    std::string payload;
    if (!request(MSG_GET_TREE, "", payload)) return {};

    std::vector<WindowInfo> windows;
    try {
        collect_windows(nlohmann::json::parse(payload), windows);
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "sway: bad GET_TREE reply: {}", e.what());
        return {};
    }
    return windows;
}

std::expected<std::string, std::string> SwayWindowManager::focus(int64_t con_id) {
    // Look the window up first so the caller gets its title back.
    std::string title;
    bool found = false;
    for (const auto& w : list_windows()) {
        if (w.con_id == con_id) {
            title = w.title;
            found = true;
            break;
        }
    }
    if (!found) return std::unexpected("window not found");

    std::string reply;
    if (!request(MSG_RUN_COMMAND, std::format("[con_id={}] focus", con_id), reply)) {
        return std::unexpected("sway IPC unavailable");
    }

    try {
        auto results = nlohmann::json::parse(reply);
        if (!results.is_array() || results.empty()) return std::unexpected("empty sway reply");
        const auto& first = results.front();
        if (!first.value("success", false)) {
            return std::unexpected(first.value("error", std::string("focus command failed")));
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::format("bad sway reply: {}", e.what()));
    }
    return title;
}

void SwayWindowManager::collect_windows(const nlohmann::json& node, std::vector<WindowInfo>& out) {
    bool has_children = false;
    for (const char* key : {"nodes", "floating_nodes"}) {
        auto it = node.find(key);
        if (it == node.end() || !it->is_array()) continue;
        for (const auto& child : *it) {
            has_children = true;
            collect_windows(child, out);
        }
    }
    if (has_children) return;

    auto type = node.value("type", "");
    if (type != "con" && type != "floating_con") return;

    // Placeholder containers have no process behind them.
    auto pid = node.value("pid", 0);
    if (pid <= 0) return;

    WindowInfo info;
    info.con_id = node.value("id", int64_t{0});
    info.title = node.contains("name") && node["name"].is_string() ? node["name"].get<std::string>() : "";
    info.pid = pid;
    if (node.contains("app_id") && node["app_id"].is_string()) {
        info.app_id = node["app_id"].get<std::string>();
    }
    if (node.contains("window_properties")) {
        info.window_class = node["window_properties"].value("class", "");
    }
    out.push_back(std::move(info));
}

bool SwayWindowManager::request(uint32_t type, const std::string& payload, std::string& reply) {
    if (query_fd_ < 0) return false;

    uint32_t reply_type;
    if (!send_message(type, payload) || !recv_message(reply_type, reply)) {
        std::println(stderr, "sway: IPC request {} failed, disconnecting", type);
        disconnect();
        return false;
    }
    return true;
}

int SwayWindowManager::connect_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "sway: connect failed: {}", std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

void SwayWindowManager::disconnect() {
    if (query_fd_ >= 0) {
        ::close(query_fd_);
        query_fd_ = -1;
    }
}

bool SwayWindowManager::send_message(uint32_t type, const std::string& payload) {
    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes)
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[14];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(query_fd_, header, 14, MSG_NOSIGNAL) != 14) return false;
    if (len > 0) {
        if (::send(query_fd_, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
            return false;
    }
    return true;
}

bool SwayWindowManager::recv_message(uint32_t& type, std::string& payload) {
    char header[14];
    size_t read_total = 0;
    while (read_total < 14) {
        ssize_t n = ::recv(query_fd_, header + read_total, 14 - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(query_fd_, payload.data() + read_total, len - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    return true;
}
