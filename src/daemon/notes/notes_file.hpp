#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

struct NotesContent {
    bool exists = false;
    std::string path;
    std::string content;
};

enum class AppendOutcome { Added, Duplicate };

// Markdown document of standing instructions for the assistant. Entries are
// only ever appended.
class NotesFile {
public:
    explicit NotesFile(std::string path);

    // A missing file is not an error: exists=false, empty content.
    std::expected<NotesContent, std::string> read() const;

    // Append "## title" + instruction under a dated byline. Fails on an empty
    // instruction; reports Duplicate (writing nothing) when the instruction
    // text is already in the file.
    std::expected<AppendOutcome, std::string>
        append(std::string_view title, std::string_view instruction, std::string_view date);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Local calendar date, "YYYY-MM-DD".
std::string local_date(std::chrono::system_clock::time_point tp);
