#pragma once

#include "config.hpp"
#include "notes/notes_file.hpp"
#include "platform/process_detector.hpp"
#include "platform/window_info.hpp"
#include "platform/window_manager.hpp"
#include "scanner/session_scanner.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Platform-independent command handling. Every command is answered
// synchronously; nothing is remembered between commands.
class DaemonCore {
public:
    DaemonCore(Config config, bool verbose,
               ProcessDetector& detector, WindowManager& windows,
               SessionScanner::Clock clock = &std::chrono::system_clock::now);

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

private:
    nlohmann::json handle_sessions(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_notes(const nlohmann::json& cmd);
    nlohmann::json handle_add_note(const nlohmann::json& cmd);
    nlohmann::json handle_windows(const nlohmann::json& cmd);
    nlohmann::json handle_focus(const nlohmann::json& cmd);

    // Enriched terminal windows ordered by container id.
    std::vector<WindowInfo> terminal_windows();
    WindowInfo enrich_window_info(WindowInfo info) const;
    bool is_agent_window(const WindowInfo& info) const;
    std::optional<WindowInfo> find_window(const std::string& term);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    ProcessDetector& detector_;
    WindowManager& windows_;

    SessionScanner::Clock clock_;
    SessionScanner scanner_;
    NotesFile notes_;
};
