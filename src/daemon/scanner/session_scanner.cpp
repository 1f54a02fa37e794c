#include "scanner/session_scanner.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <print>
#include <string_view>

namespace fs = std::filesystem;

namespace {

// Immediate children of dir matching pred, sorted by name. Errors end the
// listing early instead of throwing.
template <typename Pred>
std::vector<fs::path> list_dir(const fs::path& dir, Pred pred) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (pred(*it)) out.push_back(it->path());
    }
    if (ec) {
        std::println(stderr, "scanner: listing {} failed: {}", dir.string(), ec.message());
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

SessionScanner::SessionScanner(ScannerConfig config, Clock clock)
    : config_(std::move(config)), classifier_(config_), clock_(std::move(clock)) {}

ScanReport SessionScanner::scan() const {
    auto now = clock_();

    ScanReport report;
    report.timestamp = format_utc_timestamp(now);

    std::error_code ec;
    fs::path root(config_.projects_dir);
    if (root.empty() || !fs::is_directory(root, ec)) return report;

    auto projects = list_dir(root, [](const fs::directory_entry& e) {
        std::error_code type_ec;
        return e.is_directory(type_ec);
    });

    for (const auto& dir : projects) {
        auto project = decode_project_dir(dir.filename().string());

        for (const auto& log : active_logs(dir, now)) {
            auto snap = classifier_.classify(log.path, project, log.age_seconds);
            if (!snap) {
                std::println(stderr, "scanner: skipping {}: {}", log.path.string(), snap.error());
                continue;
            }
            accumulate(report, std::move(*snap));
        }
    }

    std::ranges::stable_sort(report.active_sessions, std::ranges::greater{},
                             [](const SessionSnapshot& s) -> std::string_view {
                                 return s.last_activity ? std::string_view(*s.last_activity)
                                                        : std::string_view{};
                             });
    return report;
}

std::vector<SessionScanner::LogFile>
SessionScanner::active_logs(const fs::path& project_dir,
                            std::chrono::system_clock::time_point now) const {
    auto candidates = list_dir(project_dir, [this](const fs::directory_entry& e) {
        std::error_code type_ec;
        return e.is_regular_file(type_ec) && is_session_log(e.path());
    });

    std::vector<LogFile> logs;
    for (auto& path : candidates) {
        std::error_code ec;
        auto mtime = fs::last_write_time(path, ec);
        if (ec) {
            std::println(stderr, "scanner: stat {} failed: {}", path.string(), ec.message());
            continue;
        }

        auto modified = std::chrono::clock_cast<std::chrono::system_clock>(mtime);
        double age = std::chrono::duration<double>(now - modified).count();
        if (age > config_.active_threshold_s) continue;

        logs.push_back({std::move(path), age});
    }
    return logs;
}

bool SessionScanner::is_session_log(const fs::path& path) const {
    auto name = path.filename().string();
    if (!name.ends_with(config_.log_extension)) return false;
    return config_.subagent_prefix.empty() || !name.starts_with(config_.subagent_prefix);
}

void SessionScanner::accumulate(ScanReport& report, SessionSnapshot snap) {
    if (is_waiting(snap.state)) {
        report.waiting_count++;
        if (std::ranges::find(report.projects_with_waiting, snap.project_name) ==
            report.projects_with_waiting.end()) {
            report.projects_with_waiting.push_back(snap.project_name);
        }
    } else if (snap.state == SessionState::Processing) {
        report.processing_count++;
    }
    report.active_sessions.push_back(std::move(snap));
}
