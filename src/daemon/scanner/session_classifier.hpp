#pragma once

#include "scanner/project_dir.hpp"
#include "scanner/scanner_config.hpp"
#include "scanner/session_snapshot.hpp"
#include "scanner/transcript_entry.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Derives a session's current state from the tail of its log.
class SessionClassifier {
public:
    explicit SessionClassifier(ScannerConfig config);

    // Read the log at `file` and classify it. Fails if the file cannot be
    // read, is empty, or its last line is not a JSON object.
    std::expected<SessionSnapshot, std::string>
        classify(const std::filesystem::path& file, const ProjectLocation& project,
                 double age_seconds) const;

    // Classify from the final lines of a log, oldest first. `fallback_id` is
    // used when the newest entry carries no session id.
    std::expected<SessionSnapshot, std::string>
        classify_tail(const std::vector<std::string>& tail, std::string_view fallback_id,
                      const ProjectLocation& project, double age_seconds) const;

private:
    static constexpr size_t PREVIEW_CHARS = 150;
    static constexpr size_t DESCRIPTION_CHARS = 100;

    void classify_assistant(const TranscriptEntry& entry, SessionSnapshot& snap) const;
    PendingApproval describe_tool_use(const ToolUse& tool) const;

    // Newest tool_use among the last lookback_lines assistant entries.
    std::optional<ToolInvocation> recover_last_tool(const std::vector<std::string>& tail) const;

    std::expected<std::vector<std::string>, std::string>
        read_tail(const std::filesystem::path& file) const;

    ScannerConfig config_;
};
