#include "render.hpp"

#include <format>

using json = nlohmann::json;

namespace {

constexpr size_t DETAIL_WIDTH = 60;

// Field as a string; null or a missing key gives the fallback.
std::string str(const json& j, const char* key, const std::string& fallback = "") {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

std::string first_line(const std::string& s) {
    auto nl = s.find('\n');
    return nl == std::string::npos ? s : s.substr(0, nl);
}

std::string clip(const std::string& s, size_t width) {
    if (s.size() <= width) return s;
    // Back up to a UTF-8 lead byte so the cut never splits a character.
    size_t cut = width - 3;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) cut--;
    return s.substr(0, cut) + "...";
}

std::string session_detail(const json& s) {
    if (auto p = s.find("pending_approval"); p != s.end() && p->is_object()) {
        auto desc = str(*p, "description");
        auto tool = str(*p, "tool_name");
        return desc.empty() ? tool : tool + ": " + first_line(desc);
    }
    auto preview = str(s, "last_message_preview");
    if (!preview.empty()) return first_line(preview);
    if (auto t = s.find("last_tool"); t != s.end() && t->is_object()) {
        return "last tool: " + str(*t, "name");
    }
    return {};
}

} // namespace

std::string format_idle(int64_t seconds) {
    if (seconds < 0) seconds = 0;
    if (seconds < 60) return std::format("{}s", seconds);
    if (seconds < 3600) return std::format("{}m{:02}s", seconds / 60, seconds % 60);
    return std::format("{}h{:02}m", seconds / 3600, (seconds % 3600) / 60);
}

std::string render_sessions(const json& report) {
    const auto& sessions = report.contains("active_sessions") ? report["active_sessions"] : json::array();

    std::string out = std::format("{} active, {} waiting, {} processing  ({})\n",
                                  sessions.size(),
                                  report.value("waiting_count", 0),
                                  report.value("processing_count", 0),
                                  str(report, "timestamp"));

    if (auto w = report.find("projects_with_waiting"); w != report.end() && w->is_array() && !w->empty()) {
        out += "Waiting:";
        for (const auto& name : *w) {
            if (name.is_string()) out += " " + name.get<std::string>();
        }
        out += "\n";
    }

    if (sessions.empty()) return out;

    out += std::format("\n{:<22} {:<20} {:>6}  {:<18} {}\n", "STATE", "PROJECT", "IDLE", "MODEL", "DETAIL");
    for (const auto& s : sessions) {
        out += std::format("{:<22} {:<20} {:>6}  {:<18} {}\n",
                           str(s, "state", "unknown"),
                           clip(str(s, "project_name"), 20),
                           format_idle(s.value("idle_seconds", int64_t{0})),
                           clip(str(s, "model", "unknown"), 18),
                           clip(session_detail(s), DETAIL_WIDTH));
    }
    return out;
}

std::string render_windows(const json& resp) {
    const auto& windows = resp.contains("windows") ? resp["windows"] : json::array();

    std::string out = std::format("{} windows, {} with an agent\n",
                                  windows.size(), resp.value("agent_count", 0));
    for (const auto& w : windows) {
        out += std::format("{} [{:>6}] {:<20} {}\n",
                           w.value("is_agent", false) ? '*' : ' ',
                           w.value("window_id", int64_t{0}),
                           clip(str(w, "project_name"), 20),
                           str(w, "window_name"));
    }
    return out;
}
