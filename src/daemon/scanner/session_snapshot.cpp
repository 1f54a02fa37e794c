#include "scanner/session_snapshot.hpp"

#include <format>

using json = nlohmann::json;

namespace {

template <typename T>
json nullable(const std::optional<T>& value) {
    if (!value) return nullptr;
    return json(*value);
}

} // namespace

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Processing: return "processing";
        case SessionState::WaitingForQuestion: return "waiting_for_question";
        case SessionState::WaitingForApproval: return "waiting_for_approval";
        case SessionState::TaskComplete: return "task_complete";
        case SessionState::Unknown: return "unknown";
    }
    return "unknown";
}

bool is_waiting(SessionState state) {
    return state == SessionState::WaitingForQuestion || state == SessionState::WaitingForApproval;
}

std::string format_utc_timestamp(std::chrono::system_clock::time_point tp) {
    return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::milliseconds>(tp));
}

void to_json(json& j, const ToolInvocation& tool) {
    j = {{"name", tool.name}, {"timestamp", nullable(tool.timestamp)}};
}

void to_json(json& j, const PendingApproval& pending) {
    j = {
        {"type", pending.kind == ApprovalKind::Question ? "question" : "tool_use"},
        {"tool_name", pending.tool_name},
        {"description", pending.description},
    };
}

void to_json(json& j, const SessionSnapshot& snap) {
    j = {
        {"session_id", snap.session_id},
        {"project_path", snap.project_path},
        {"project_name", snap.project_name},
        {"state", std::string(to_string(snap.state))},
        {"last_activity", nullable(snap.last_activity)},
        {"idle_seconds", snap.idle_seconds},
        {"model", snap.model},
        {"last_tool", nullable(snap.last_tool)},
        {"last_message_preview", snap.last_message_preview},
        {"pending_approval", nullable(snap.pending_approval)},
    };
}

void to_json(json& j, const ScanReport& report) {
    j = {
        {"timestamp", report.timestamp},
        {"active_sessions", report.active_sessions},
        {"waiting_count", report.waiting_count},
        {"processing_count", report.processing_count},
        {"projects_with_waiting", report.projects_with_waiting},
    };
}
