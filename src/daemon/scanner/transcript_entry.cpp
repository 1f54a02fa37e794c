#include "scanner/transcript_entry.hpp"

using json = nlohmann::json;

namespace {

std::optional<std::string> optional_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::string string_or(const json& obj, const char* key, std::string fallback) {
    return optional_string(obj, key).value_or(std::move(fallback));
}

ContentItem parse_content_item(const json& item) {
    auto type = string_or(item, "type", "");

    if (type == "tool_use") {
        ToolUse tool{.name = string_or(item, "name", "Unknown")};
        auto input = item.find("input");
        if (input != item.end() && input->is_object()) tool.input = *input;
        return tool;
    }
    if (type == "text") {
        return TextBlock{.text = string_or(item, "text", "")};
    }
    return OtherContent{.type = std::move(type)};
}

} // namespace

const ToolUse* TranscriptEntry::first_tool_use() const {
    for (const auto& item : content) {
        if (auto* tool = std::get_if<ToolUse>(&item)) return tool;
    }
    return nullptr;
}

std::expected<TranscriptEntry, std::string> parse_entry(std::string_view line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string(e.what()));
    }
    if (!j.is_object()) {
        return std::unexpected("entry is not a JSON object");
    }

    TranscriptEntry entry;

    auto type = string_or(j, "type", "unknown");
    if (type == "user") entry.type = EntryType::User;
    else if (type == "assistant") entry.type = EntryType::Assistant;

    entry.session_id = optional_string(j, "sessionId");
    entry.timestamp = optional_string(j, "timestamp");

    auto message = j.find("message");
    if (message != j.end() && message->is_object()) {
        entry.model = optional_string(*message, "model");

        // User messages may carry a plain string here; only arrays hold items.
        auto content = message->find("content");
        if (content != message->end() && content->is_array()) {
            for (const auto& item : *content) {
                if (!item.is_object()) continue;
                entry.content.push_back(parse_content_item(item));
            }
        }
    }

    return entry;
}
