#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Content items of an assistant message.
struct ToolUse {
    std::string name;
    nlohmann::json input = nlohmann::json::object(); // always an object
};

struct TextBlock {
    std::string text;
};

// Any item whose "type" tag we do not interpret (thinking, tool_result, ...).
struct OtherContent {
    std::string type;
};

using ContentItem = std::variant<ToolUse, TextBlock, OtherContent>;

enum class EntryType { User, Assistant, Other };

// One line of a session log.
struct TranscriptEntry {
    EntryType type = EntryType::Other;
    std::optional<std::string> session_id;
    std::optional<std::string> timestamp;
    std::optional<std::string> model;
    std::vector<ContentItem> content;

    // First tool_use item in content order, if any.
    const ToolUse* first_tool_use() const;
};

// Parse one JSON Lines record. Fails on malformed JSON or a value that is not
// an object; missing or mistyped fields fall back to their defaults.
std::expected<TranscriptEntry, std::string> parse_entry(std::string_view line);
