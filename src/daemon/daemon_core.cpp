#include "daemon_core.hpp"

#include "text_util.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json error_response(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose,
                       ProcessDetector& detector, WindowManager& windows,
                       SessionScanner::Clock clock)
    : config_(std::move(config)), verbose_(verbose),
      detector_(detector), windows_(windows),
      clock_(std::move(clock)),
      scanner_(config_.scanner, clock_),
      notes_(config_.notes.path) {}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd) {
    try {
        if (cmd_str == "sessions") return handle_sessions(cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "notes") return handle_notes(cmd);
        if (cmd_str == "add-note") return handle_add_note(cmd);
        if (cmd_str == "windows") return handle_windows(cmd);
        if (cmd_str == "focus") return handle_focus(cmd);
    } catch (const json::exception& e) {
        return error_response(std::format("invalid arguments: {}", e.what()));
    }
    return error_response("unknown command");
}

json DaemonCore::handle_sessions(const json& /*cmd*/) {
    auto report = scanner_.scan();
    log(std::format("Scan: {} active, {} waiting, {} processing",
                    report.active_sessions.size(), report.waiting_count, report.processing_count));

    json resp = report;
    resp["status"] = "ok";
    return resp;
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    return {
        {"status", "ok"},
        {"projects_dir", config_.scanner.projects_dir},
        {"notes_path", notes_.path()},
        {"active_threshold_s", config_.scanner.active_threshold_s},
        {"idle_threshold_s", config_.scanner.idle_threshold_s},
        {"window_manager", windows_.connected()},
    };
}

json DaemonCore::handle_notes(const json& /*cmd*/) {
    auto notes = notes_.read();
    if (!notes) {
        std::println(stderr, "notes: {}", notes.error());
        return error_response(notes.error());
    }
    return {
        {"status", "ok"},
        {"exists", notes->exists},
        {"path", notes->path},
        {"content", notes->content},
    };
}

json DaemonCore::handle_add_note(const json& cmd) {
    auto title = cmd.value("title", "");
    auto instruction = cmd.value("instruction", "");

    auto outcome = notes_.append(title, instruction, local_date(clock_()));
    if (!outcome) {
        std::println(stderr, "notes: append failed: {}", outcome.error());
        return error_response(outcome.error());
    }

    if (*outcome == AppendOutcome::Duplicate) {
        return {
            {"status", "ok"},
            {"added", false},
            {"message", "This instruction already exists in " + notes_.path()},
            {"path", notes_.path()},
        };
    }

    log("Note added to " + notes_.path());
    return {
        {"status", "ok"},
        {"added", true},
        {"message", "Instruction added to " + notes_.path()},
        {"path", notes_.path()},
    };
}

json DaemonCore::handle_windows(const json& /*cmd*/) {
    if (!windows_.connected()) return error_response("window manager not available");

    json list = json::array();
    int agent_count = 0;
    for (const auto& w : terminal_windows()) {
        bool is_agent = is_agent_window(w);
        if (is_agent) agent_count++;
        list.push_back({
            {"window_id", w.con_id},
            {"window_name", w.title},
            {"app_id", !w.app_id.empty() ? w.app_id : w.window_class},
            {"pid", w.pid},
            {"agent", w.agent},
            {"project_name", w.project_name},
            {"project_path", w.working_dir.empty() ? json(nullptr) : json(w.working_dir)},
            {"is_agent", is_agent},
        });
    }

    return {
        {"status", "ok"},
        {"windows", list},
        {"count", list.size()},
        {"agent_count", agent_count},
    };
}

json DaemonCore::handle_focus(const json& cmd) {
    if (!windows_.connected()) return error_response("window manager not available");

    int64_t con_id = 0;
    if (cmd.contains("window_id")) {
        con_id = cmd["window_id"].get<int64_t>();
    } else {
        auto term = std::string(text::trim(cmd.value("project", "")));
        if (term.empty()) return error_response("window_id or project required");

        auto window = find_window(term);
        if (!window) {
            return error_response(std::format("could not find terminal window containing '{}'", term));
        }
        con_id = window->con_id;
    }

    auto focused = windows_.focus(con_id);
    if (!focused) return error_response(focused.error());

    log(std::format("Focused window {} ({})", con_id, *focused));
    return {{"status", "ok"}, {"window_id", con_id}, {"window_name", *focused}};
}

std::vector<WindowInfo> DaemonCore::terminal_windows() {
    std::vector<WindowInfo> windows;
    for (auto& w : windows_.list_windows()) {
        windows.push_back(enrich_window_info(std::move(w)));
    }
    std::ranges::sort(windows, {}, &WindowInfo::con_id);
    return windows;
}

WindowInfo DaemonCore::enrich_window_info(WindowInfo info) const {
    if (info.pid > 0) {
        auto detection = detector_.detect(info.pid);
        if (!detection.agent.empty()) {
            info.agent = detection.agent;
            info.working_dir = detection.working_dir;
        }
    }

    if (!info.working_dir.empty()) {
        info.project_name = fs::path(info.working_dir).filename().string();
    } else {
        // Terminals commonly title windows "project — command".
        auto sep = info.title.find(" — ");
        info.project_name = std::string(text::trim(
            sep == std::string::npos ? std::string_view(info.title)
                                     : std::string_view(info.title).substr(0, sep)));
    }
    return info;
}

bool DaemonCore::is_agent_window(const WindowInfo& info) const {
    if (!info.agent.empty()) return true;
    auto title = text::to_lower(info.title);
    return std::ranges::any_of(config_.agents, [&](const std::string& agent) {
        return !agent.empty() && title.find(text::to_lower(agent)) != std::string::npos;
    });
}

std::optional<WindowInfo> DaemonCore::find_window(const std::string& term) {
    auto needle = text::to_lower(term);
    auto windows = terminal_windows();

    for (const auto& w : windows) {
        if (text::to_lower(w.project_name) == needle) return w;
    }
    for (const auto& w : windows) {
        if (text::to_lower(w.title).find(needle) != std::string::npos) return w;
    }
    return std::nullopt;
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[agent-watch] {}", msg);
    }
}
