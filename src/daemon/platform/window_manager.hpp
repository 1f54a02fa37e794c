#pragma once

#include "platform/window_info.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

class WindowManager {
public:
    virtual ~WindowManager() = default;
    virtual bool connect() = 0;
    virtual bool connected() const = 0;
    // Every application window in the layout, unenriched.
    virtual std::vector<WindowInfo> list_windows() = 0;
    // Raise and focus the window; returns its title on success.
    virtual std::expected<std::string, std::string> focus(int64_t con_id) = 0;
};
