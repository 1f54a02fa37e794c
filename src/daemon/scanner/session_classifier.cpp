#include "scanner/session_classifier.hpp"

#include "text_util.hpp"

#include <algorithm>
#include <deque>
#include <fstream>
#include <variant>

namespace fs = std::filesystem;

namespace {

template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

std::string make_preview(std::string_view text, size_t max_chars) {
    if (text::char_count(text) <= max_chars) return std::string(text);
    return text::truncate_chars(text, max_chars) + "...";
}

bool ends_with_question(std::string_view text) {
    return text::trim(text).ends_with('?');
}

} // namespace

SessionClassifier::SessionClassifier(ScannerConfig config)
    : config_(std::move(config)) {}

std::expected<SessionSnapshot, std::string>
SessionClassifier::classify(const fs::path& file, const ProjectLocation& project,
                            double age_seconds) const {
    auto tail = read_tail(file);
    if (!tail) return std::unexpected(tail.error());
    return classify_tail(*tail, file.stem().string(), project, age_seconds);
}

std::expected<SessionSnapshot, std::string>
SessionClassifier::classify_tail(const std::vector<std::string>& tail, std::string_view fallback_id,
                                 const ProjectLocation& project, double age_seconds) const {
    if (tail.empty()) return std::unexpected("log is empty");

    auto last = parse_entry(tail.back());
    if (!last) return std::unexpected("last entry: " + last.error());

    SessionSnapshot snap;
    snap.session_id = last->session_id.value_or(std::string(fallback_id));
    snap.project_name = project.name;
    snap.project_path = project.path;
    snap.last_activity = last->timestamp;
    snap.idle_seconds = static_cast<int64_t>(age_seconds);
    snap.model = last->model.value_or("unknown");

    // Time since the last write overrides whatever the entry says.
    if (age_seconds > config_.idle_threshold_s) {
        snap.state = SessionState::Idle;
    } else {
        switch (last->type) {
            case EntryType::User:
                snap.state = SessionState::Processing;
                break;
            case EntryType::Assistant:
                classify_assistant(*last, snap);
                break;
            case EntryType::Other:
                snap.state = SessionState::Unknown;
                break;
        }
    }

    if (!snap.last_tool) {
        snap.last_tool = recover_last_tool(tail);
    }
    return snap;
}

void SessionClassifier::classify_assistant(const TranscriptEntry& entry, SessionSnapshot& snap) const {
    bool has_question = false;

    for (const auto& item : entry.content) {
        // The first tool_use decides; later items are never looked at.
        bool decided = std::visit(overloaded{
            [&](const ToolUse& tool) {
                snap.pending_approval = describe_tool_use(tool);
                snap.state = snap.pending_approval->kind == ApprovalKind::Question
                                 ? SessionState::WaitingForQuestion
                                 : SessionState::WaitingForApproval;
                snap.last_tool = ToolInvocation{.name = tool.name, .timestamp = entry.timestamp};
                return true;
            },
            [&](const TextBlock& block) {
                snap.last_message_preview = make_preview(block.text, PREVIEW_CHARS);
                if (ends_with_question(block.text)) has_question = true;
                return false;
            },
            [](const OtherContent&) { return false; },
        }, item);

        if (decided) return;
    }

    // A trailing question reads as a request for input; otherwise the
    // assistant is done and waiting for a new instruction.
    snap.state = has_question ? SessionState::WaitingForQuestion : SessionState::TaskComplete;
}

PendingApproval SessionClassifier::describe_tool_use(const ToolUse& tool) const {
    if (tool.name == config_.question_tool) {
        auto it = tool.input.find("questions");
        auto questions = it != tool.input.end() ? *it : nlohmann::json::array();
        return {
            .kind = ApprovalKind::Question,
            .tool_name = tool.name,
            .description = text::truncate_chars(
                questions.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                DESCRIPTION_CHARS),
        };
    }

    std::string description;
    if (auto it = tool.input.find("description"); it != tool.input.end() && it->is_string()) {
        description = it->get<std::string>();
    } else if (auto cmd = tool.input.find("command"); cmd != tool.input.end() && cmd->is_string()) {
        description = text::truncate_chars(cmd->get<std::string>(), DESCRIPTION_CHARS);
    }
    return {.kind = ApprovalKind::ToolUse, .tool_name = tool.name, .description = std::move(description)};
}

std::optional<ToolInvocation>
SessionClassifier::recover_last_tool(const std::vector<std::string>& tail) const {
    size_t window = std::min(config_.lookback_lines, tail.size());
    for (auto it = tail.rbegin(); it != tail.rbegin() + static_cast<std::ptrdiff_t>(window); ++it) {
        auto entry = parse_entry(*it);
        if (!entry || entry->type != EntryType::Assistant) continue;

        if (const auto* tool = entry->first_tool_use()) {
            return ToolInvocation{.name = tool->name, .timestamp = entry->timestamp};
        }
    }
    return std::nullopt;
}

std::expected<std::vector<std::string>, std::string>
SessionClassifier::read_tail(const fs::path& file) const {
    std::ifstream f(file);
    if (!f.is_open()) return std::unexpected("could not open file");

    // Only the newest lines matter; keep a bounded window while streaming.
    size_t keep = std::max<size_t>(config_.lookback_lines, 1);
    std::deque<std::string> window;
    std::string line;
    while (std::getline(f, line)) {
        window.push_back(std::move(line));
        if (window.size() > keep) window.pop_front();
    }
    if (f.bad()) return std::unexpected("read error");

    return std::vector<std::string>(std::make_move_iterator(window.begin()),
                                    std::make_move_iterator(window.end()));
}
