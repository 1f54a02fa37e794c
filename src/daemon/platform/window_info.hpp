#pragma once

#include <cstdint>
#include <string>

struct WindowInfo {
    int64_t con_id = 0;        // compositor container id, stable while the window lives
    std::string app_id;        // Wayland app_id (e.g. "kitty")
    std::string window_class;  // X11 class (e.g. "XTerm")
    std::string title;         // window title
    int pid = 0;               // window process PID
    std::string agent;         // detected assistant CLI, e.g. "claude"
    std::string working_dir;   // agent's cwd
    std::string project_name;  // last segment of working_dir, or title prefix

    bool empty() const { return con_id == 0 && app_id.empty() && window_class.empty() && title.empty() && pid == 0; }
};
