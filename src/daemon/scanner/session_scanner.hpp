#pragma once

#include "scanner/project_dir.hpp"
#include "scanner/scanner_config.hpp"
#include "scanner/session_classifier.hpp"
#include "scanner/session_snapshot.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <vector>

// Stateless scan of a projects directory. Every call re-reads the
// filesystem; nothing is cached between calls.
class SessionScanner {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit SessionScanner(ScannerConfig config, Clock clock = &std::chrono::system_clock::now);

    ScanReport scan() const;

    const ScannerConfig& config() const { return config_; }

private:
    struct LogFile {
        std::filesystem::path path;
        double age_seconds;
    };

    // Recently modified session logs in one project directory, by name.
    std::vector<LogFile> active_logs(const std::filesystem::path& project_dir,
                                     std::chrono::system_clock::time_point now) const;

    bool is_session_log(const std::filesystem::path& path) const;

    static void accumulate(ScanReport& report, SessionSnapshot snap);

    ScannerConfig config_;
    SessionClassifier classifier_;
    Clock clock_;
};
