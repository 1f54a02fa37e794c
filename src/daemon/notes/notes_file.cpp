#include "notes/notes_file.hpp"

#include "text_util.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

NotesFile::NotesFile(std::string path)
    : path_(std::move(path)) {}

std::expected<NotesContent, std::string> NotesFile::read() const {
    NotesContent notes{.exists = false, .path = path_, .content = {}};

    std::error_code ec;
    if (!fs::exists(path_, ec)) return notes;

    std::ifstream f(path_, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(std::format("could not open {}: {}", path_, std::strerror(errno)));
    }

    std::ostringstream ss;
    ss << f.rdbuf();
    notes.exists = true;
    notes.content = ss.str();
    return notes;
}

std::expected<AppendOutcome, std::string>
NotesFile::append(std::string_view title, std::string_view instruction, std::string_view date) {
    auto body = text::trim(instruction);
    if (body.empty()) return std::unexpected("no instruction provided");

    fs::path p(path_);
    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            return std::unexpected(std::format("could not create {}: {}",
                                               p.parent_path().string(), ec.message()));
        }
    }

    auto existing = read();
    if (!existing) return std::unexpected(existing.error());
    if (existing->content.find(body) != std::string::npos) {
        return AppendOutcome::Duplicate;
    }

    std::ofstream f(path_, std::ios::app | std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(std::format("could not open {} for append: {}",
                                           path_, std::strerror(errno)));
    }

    f << std::format("\n\n## {}\n*Added {} via agent-watch*\n\n{}\n", text::trim(title), date, body);
    f.flush();
    if (!f) return std::unexpected("write to " + path_ + " failed");

    return AppendOutcome::Added;
}

std::string local_date(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return std::format("{:04}-{:02}-{:02}", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}
