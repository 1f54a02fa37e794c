#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"
#include "render.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  sessions [--json]                       List active agent sessions");
    std::println(stderr, "  watch [--interval MS] [--count N]       Refresh the session list repeatedly");
    std::println(stderr, "  status                                  Show daemon status");
    std::println(stderr, "  notes                                   Print the operator notes document");
    std::println(stderr, "  add-note [--title T] TEXT...            Append an instruction to the notes");
    std::println(stderr, "  windows [--json]                        List terminal windows");
    std::println(stderr, "  focus PROJECT | --id N                  Focus the window for a project");
}

static bool parse_int(const std::string& s, long long& out) {
    char* end = nullptr;
    out = std::strtoll(s.c_str(), &end, 10);
    return !s.empty() && end && *end == '\0';
}

static bool is_error(const json& response) {
    if (response.value("status", "") != "error") return false;
    std::println(stderr, "Error: {}", response.value("message", "unknown error"));
    return true;
}

static int run_watch(IpcClient& client, long long interval_ms, long long count) {
    for (long long i = 0; count == 0 || i < count; i++) {
        if (i > 0) std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));

        json response;
        if (!client.request({{"cmd", "sessions"}}, response)) {
            std::println(stderr, "Lost connection to daemon");
            return 1;
        }
        if (is_error(response)) return 1;

        // Clear and home the cursor before each redraw.
        std::print("\x1b[H\x1b[2J{}", render_sessions(response));
        std::fflush(stdout);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    bool raw_json = false;
    long long interval_ms = 2000;
    long long count = 0;
    long long window_id = -1;
    std::string title = "Agent Instruction";
    std::vector<std::string> words;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--json") {
            raw_json = true;
        } else if ((arg == "--interval" || arg == "--count" || arg == "--id") && i + 1 < argc) {
            long long value = 0;
            if (!parse_int(argv[++i], value) || value < 0) {
                std::println(stderr, "Invalid value for {}: {}", arg, argv[i]);
                return 1;
            }
            if (arg == "--interval") interval_ms = value;
            else if (arg == "--count") count = value;
            else window_id = value;
        } else if (arg == "--title" && i + 1 < argc) {
            title = argv[++i];
        } else {
            words.push_back(std::move(arg));
        }
    }

    auto joined = [&] {
        std::string out;
        for (const auto& w : words) {
            if (!out.empty()) out += ' ';
            out += w;
        }
        return out;
    };

    json cmd;
    if (command == "sessions" || command == "watch") {
        cmd = {{"cmd", "sessions"}};
    } else if (command == "status" || command == "notes" || command == "windows") {
        cmd = {{"cmd", command}};
    } else if (command == "add-note") {
        if (words.empty()) {
            std::println(stderr, "add-note needs instruction text");
            return 1;
        }
        cmd = {{"cmd", "add-note"}, {"title", title}, {"instruction", joined()}};
    } else if (command == "focus") {
        if (window_id >= 0) {
            cmd = {{"cmd", "focus"}, {"window_id", window_id}};
        } else if (!words.empty()) {
            cmd = {{"cmd", "focus"}, {"project", joined()}};
        } else {
            std::println(stderr, "focus needs a project name or --id");
            return 1;
        }
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is agent-watchd running?");
        return 1;
    }

    if (command == "watch") return run_watch(client, interval_ms, count);

    json response;
    if (!client.request(cmd, response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }
    if (is_error(response)) return 1;

    if (raw_json) {
        response.erase("status");
        std::println("{}", response.dump(2, ' ', false, json::error_handler_t::replace));
    } else if (command == "sessions") {
        std::print("{}", render_sessions(response));
    } else if (command == "windows") {
        std::print("{}", render_windows(response));
    } else if (command == "status") {
        std::println("Projects:       {}", response.value("projects_dir", ""));
        std::println("Notes:          {}", response.value("notes_path", ""));
        std::println("Active within:  {}s", response.value("active_threshold_s", 0));
        std::println("Idle after:     {}s", response.value("idle_threshold_s", 0));
        std::println("Window manager: {}", response.value("window_manager", false) ? "connected" : "unavailable");
    } else if (command == "notes") {
        if (!response.value("exists", false)) {
            std::println("No notes at {}", response.value("path", ""));
        } else {
            std::print("{}", response.value("content", ""));
        }
    } else if (command == "add-note") {
        std::println("{}", response.value("message", "OK"));
    } else if (command == "focus") {
        std::println("Focused [{}] {}", response.value("window_id", int64_t{0}),
                     response.value("window_name", ""));
    }

    return 0;
}
