#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class SessionState {
    Idle,
    Processing,
    WaitingForQuestion,
    WaitingForApproval,
    TaskComplete,
    Unknown,
};

std::string_view to_string(SessionState state);

// True for the states that need a human to respond.
bool is_waiting(SessionState state);

struct ToolInvocation {
    std::string name;
    std::optional<std::string> timestamp;
};

enum class ApprovalKind { Question, ToolUse };

// What a waiting session is blocked on.
struct PendingApproval {
    ApprovalKind kind = ApprovalKind::ToolUse;
    std::string tool_name;
    std::string description;
};

struct SessionSnapshot {
    std::string session_id;
    std::string project_name;
    std::string project_path;
    SessionState state = SessionState::Unknown;
    std::optional<std::string> last_activity;
    int64_t idle_seconds = 0;
    std::string model = "unknown";
    std::optional<ToolInvocation> last_tool;
    std::string last_message_preview;
    std::optional<PendingApproval> pending_approval;
};

struct ScanReport {
    std::string timestamp;
    std::vector<SessionSnapshot> active_sessions; // most recently active first
    int waiting_count = 0;
    int processing_count = 0;
    std::vector<std::string> projects_with_waiting;
};

// ISO-8601 UTC with millisecond precision, e.g. "2026-10-17T09:30:00.123Z".
std::string format_utc_timestamp(std::chrono::system_clock::time_point tp);

void to_json(nlohmann::json& j, const ToolInvocation& tool);
void to_json(nlohmann::json& j, const PendingApproval& pending);
void to_json(nlohmann::json& j, const SessionSnapshot& snap);
void to_json(nlohmann::json& j, const ScanReport& report);
