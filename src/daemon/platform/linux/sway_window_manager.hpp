#pragma once

#include "platform/window_manager.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

class SwayWindowManager : public WindowManager {
public:
    SwayWindowManager();
    ~SwayWindowManager() override;

    SwayWindowManager(const SwayWindowManager&) = delete;
    SwayWindowManager& operator=(const SwayWindowManager&) = delete;

    // Connect to $SWAYSOCK. Returns false if unset or unreachable.
    bool connect() override;
    bool connected() const override { return query_fd_ >= 0; }
    std::vector<WindowInfo> list_windows() override;
    std::expected<std::string, std::string> focus(int64_t con_id) override;

    // Leaf windows of a GET_TREE reply, in tree order.
    static void collect_windows(const nlohmann::json& node, std::vector<WindowInfo>& out);

private:
    // i3-ipc binary protocol
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_GET_TREE = 4;

    bool send_message(uint32_t type, const std::string& payload = "");
    bool recv_message(uint32_t& type, std::string& payload);
    // Send and wait for the reply; drops the connection on I/O failure.
    bool request(uint32_t type, const std::string& payload, std::string& reply);

    int connect_socket(const std::string& path);
    void disconnect();

    int query_fd_ = -1;
    std::string sway_sock_;
};
