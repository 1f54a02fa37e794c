#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

std::string agent_home() {
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.claude";
}

} // namespace

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/agent-watch";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/agent-watch";
}

std::string projects_dir() {
    auto base = agent_home();
    if (base.empty()) return {};
    return base + "/projects";
}

std::string notes_path() {
    auto base = agent_home();
    if (base.empty()) return "/tmp/agent-watch/CLAUDE.md";
    return base + "/CLAUDE.md";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/agent-watch.sock";
    return "/tmp/agent-watch.sock";
}

} // namespace platform
