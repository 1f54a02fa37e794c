#include <catch2/catch_test_macros.hpp>

#include "scanner/session_scanner.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

// RAII temp directory that auto-deletes.
struct TmpDir {
    fs::path path;

    TmpDir() {
        auto tmpl = (fs::temp_directory_path() / "aw_test_scan_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        path = mkdtemp(buf.data());
    }

    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TmpDir(const TmpDir&) = delete;
    TmpDir& operator=(const TmpDir&) = delete;
};

const auto NOW = std::chrono::sys_days{std::chrono::year{2026} / 10 / 17} + 9h;

SessionScanner::Clock fixed_clock() {
    return [] { return std::chrono::system_clock::time_point(NOW); };
}

// Write a log and backdate its mtime to `age` before NOW.
void write_log(const fs::path& file, const std::vector<std::string>& lines,
               std::chrono::seconds age) {
    fs::create_directories(file.parent_path());
    {
        std::ofstream f(file);
        for (const auto& l : lines) f << l << '\n';
    }
    auto mtime = std::chrono::clock_cast<std::chrono::file_clock>(
        std::chrono::system_clock::time_point(NOW - age));
    fs::last_write_time(file, mtime);
}

const std::string BASH_LS =
    R"({"type":"assistant","message":{"content":[{"type":"tool_use","name":"Bash","input":{"command":"ls -la"}}]}})";

std::string user_at(const std::string& ts) {
    return json{{"type", "user"}, {"timestamp", ts}, {"message", {{"content", "go"}}}}.dump();
}

ScannerConfig config_for(const fs::path& root) {
    ScannerConfig cfg;
    cfg.projects_dir = root.string();
    return cfg;
}

} // namespace

TEST_CASE("SessionScanner", "[scanner]") {
    TmpDir root;
    SessionScanner scanner(config_for(root.path), fixed_clock());

    SECTION("RecentToolUseWaitsForApproval") {
        write_log(root.path / "-Users-alice-proj" / "s1.jsonl", {BASH_LS}, 60s);

        auto report = scanner.scan();
        REQUIRE(report.timestamp == "2026-10-17T09:00:00.000Z");
        REQUIRE(report.active_sessions.size() == 1);

        const auto& s = report.active_sessions[0];
        REQUIRE(s.project_name == "proj");
        REQUIRE(s.project_path == "/Users/alice/proj");
        REQUIRE(s.state == SessionState::WaitingForApproval);
        REQUIRE(s.pending_approval.has_value());
        REQUIRE(s.pending_approval->tool_name == "Bash");
        REQUIRE(s.pending_approval->description == "ls -la");
        REQUIRE(s.session_id == "s1");
        REQUIRE(s.idle_seconds == 60);
        REQUIRE(report.waiting_count == 1);
        REQUIRE(report.processing_count == 0);
        REQUIRE(report.projects_with_waiting == std::vector<std::string>{"proj"});
    }

    SECTION("StaleLogExcluded") {
        write_log(root.path / "-Users-alice-proj" / "s1.jsonl", {BASH_LS}, 700s);

        auto report = scanner.scan();
        REQUIRE(report.active_sessions.empty());
        REQUIRE(report.waiting_count == 0);
        REQUIRE(report.processing_count == 0);
        REQUIRE(report.projects_with_waiting.empty());
    }

    SECTION("AgeBetweenThresholdsIsIdle") {
        write_log(root.path / "-Users-alice-proj" / "s1.jsonl", {BASH_LS}, 400s);

        auto report = scanner.scan();
        REQUIRE(report.active_sessions.size() == 1);
        REQUIRE(report.active_sessions[0].state == SessionState::Idle);
        REQUIRE(report.waiting_count == 0);
        REQUIRE(report.projects_with_waiting.empty());
    }

    SECTION("EmptyLogExcluded") {
        write_log(root.path / "-Users-alice-proj" / "empty.jsonl", {}, 10s);
        write_log(root.path / "-Users-alice-proj" / "s1.jsonl", {user_at("t")}, 10s);

        auto report = scanner.scan();
        REQUIRE(report.active_sessions.size() == 1);
        REQUIRE(report.active_sessions[0].session_id == "s1");
        REQUIRE(report.processing_count == 1);
    }

    SECTION("SubagentAndForeignFilesSkipped") {
        auto dir = root.path / "-Users-alice-proj";
        write_log(dir / "agent-1234.jsonl", {BASH_LS}, 10s);
        write_log(dir / "notes.txt", {BASH_LS}, 10s);
        write_log(dir / "s1.jsonl", {user_at("t")}, 10s);
        fs::create_directories(dir / "nested.jsonl");

        auto report = scanner.scan();
        REQUIRE(report.active_sessions.size() == 1);
        REQUIRE(report.active_sessions[0].session_id == "s1");
        REQUIRE(report.waiting_count == 0);
    }

    SECTION("LooseFilesAtRootIgnored") {
        write_log(root.path / "stray.jsonl", {BASH_LS}, 10s);
        REQUIRE(scanner.scan().active_sessions.empty());
    }

    SECTION("MalformedLastLineSkipsOnlyThatFile") {
        auto dir = root.path / "-Users-alice-proj";
        write_log(dir / "bad.jsonl", {user_at("t"), "{truncated"}, 10s);
        write_log(dir / "good.jsonl", {user_at("t")}, 10s);

        auto report = scanner.scan();
        REQUIRE(report.active_sessions.size() == 1);
        REQUIRE(report.active_sessions[0].session_id == "good");
    }

    SECTION("OrderedByLastActivityDescending") {
        write_log(root.path / "-home-a-one" / "s1.jsonl", {user_at("2026-10-17T08:58:00Z")}, 10s);
        write_log(root.path / "-home-a-two" / "s2.jsonl", {user_at("2026-10-17T08:59:00Z")}, 10s);
        write_log(root.path / "-home-a-three" / "s3.jsonl", {R"({"type":"user"})"}, 10s);
        write_log(root.path / "-home-a-four" / "s4.jsonl", {user_at("2026-10-17T08:57:00Z")}, 10s);

        auto report = scanner.scan();
        REQUIRE(report.active_sessions.size() == 4);
        REQUIRE(report.active_sessions[0].project_name == "two");
        REQUIRE(report.active_sessions[1].project_name == "one");
        REQUIRE(report.active_sessions[2].project_name == "four");
        REQUIRE(report.active_sessions[3].project_name == "three");
        REQUIRE_FALSE(report.active_sessions[3].last_activity.has_value());
        REQUIRE(report.processing_count == 4);
    }

    SECTION("WaitingProjectsDeduplicated") {
        auto dir = root.path / "-Users-alice-proj";
        write_log(dir / "s1.jsonl", {BASH_LS}, 10s);
        write_log(dir / "s2.jsonl", {BASH_LS}, 20s);

        auto report = scanner.scan();
        REQUIRE(report.waiting_count == 2);
        REQUIRE(report.projects_with_waiting == std::vector<std::string>{"proj"});
    }

    SECTION("QuestionCountsAsWaitingNotProcessing") {
        write_log(root.path / "-Users-alice-proj" / "s1.jsonl",
                  {R"({"type":"assistant","message":{"content":[{"type":"tool_use","name":"AskUserQuestion","input":{"questions":[{"question":"Which?"}]}}]}})"},
                  10s);

        auto report = scanner.scan();
        REQUIRE(report.active_sessions.size() == 1);
        REQUIRE(report.active_sessions[0].state == SessionState::WaitingForQuestion);
        REQUIRE(report.active_sessions[0].pending_approval->kind == ApprovalKind::Question);
        REQUIRE(report.waiting_count == 1);
        REQUIRE(report.processing_count == 0);
    }

    SECTION("CompleteAndProcessingAreNotWaiting") {
        write_log(root.path / "-home-a-done" / "s1.jsonl",
                  {R"({"type":"assistant","message":{"content":[{"type":"text","text":"Done."}]}})"}, 10s);
        write_log(root.path / "-home-a-busy" / "s2.jsonl", {user_at("2026-10-17T08:59:00Z")}, 10s);

        auto report = scanner.scan();
        REQUIRE(report.active_sessions.size() == 2);
        REQUIRE(report.waiting_count == 0);
        REQUIRE(report.processing_count == 1);
        REQUIRE(report.projects_with_waiting.empty());

        for (const auto& s : report.active_sessions) {
            if (s.project_name == "done") REQUIRE(s.state == SessionState::TaskComplete);
            if (s.project_name == "busy") REQUIRE(s.state == SessionState::Processing);
        }
    }

    SECTION("RepeatedScansAgree") {
        auto dir = root.path / "-Users-alice-proj";
        write_log(dir / "s1.jsonl", {BASH_LS}, 10s);
        write_log(dir / "s2.jsonl", {user_at("2026-10-17T08:59:00Z")}, 30s);

        json first = scanner.scan();
        json second = scanner.scan();
        REQUIRE(first == second);
    }

    SECTION("MissingRootGivesEmptyReport") {
        SessionScanner missing(config_for(root.path / "does-not-exist"), fixed_clock());
        auto report = missing.scan();
        REQUIRE(report.active_sessions.empty());
        REQUIRE(report.timestamp == "2026-10-17T09:00:00.000Z");
    }

    SECTION("RootIsAFile") {
        write_log(root.path / "file", {BASH_LS}, 10s);
        SessionScanner on_file(config_for(root.path / "file"), fixed_clock());
        REQUIRE(on_file.scan().active_sessions.empty());
    }
}
