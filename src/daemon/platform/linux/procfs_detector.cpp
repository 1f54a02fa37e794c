#include "platform/linux/procfs_detector.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

ProcfsDetector::ProcfsDetector(std::vector<std::string> known_agents)
    : known_agents_(std::move(known_agents)) {
    // An empty name is a substring of every comm and argv entry.
    std::erase_if(known_agents_, [](const std::string& a) { return a.empty(); });
}

DetectionResult ProcfsDetector::detect(int pid) const {
    if (pid <= 0 || known_agents_.empty()) return {};

    DetectionResult result;
    search_tree(pid, result, 0);
    return result;
}

std::string ProcfsDetector::read_comm(int pid) {
    std::ifstream f(std::format("/proc/{}/comm", pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

std::string ProcfsDetector::read_cwd(int pid) {
    std::error_code ec;
    auto path = fs::read_symlink(std::format("/proc/{}/cwd", pid), ec);
    if (ec) return {};
    return path.string();
}

std::vector<std::string> ProcfsDetector::read_launch_args(int pid) {
    std::ifstream f(std::format("/proc/{}/cmdline", pid), std::ios::binary);
    if (!f.is_open()) return {};

    std::string raw{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};

    std::vector<std::string> args;
    size_t start = 0;
    while (start < raw.size() && args.size() < 2) {
        auto end = raw.find('\0', start);
        if (end == std::string::npos) end = raw.size();
        args.push_back(raw.substr(start, end - start));
        start = end + 1;
    }
    return args;
}

std::vector<int> ProcfsDetector::get_children(int pid) {
    std::vector<int> children;

    std::string task_path = std::format("/proc/{}/task", pid);
    std::error_code ec;
    for (auto& entry : fs::directory_iterator(task_path, ec)) {
        auto children_file = entry.path() / "children";
        std::ifstream f(children_file);
        if (!f.is_open()) continue;

        int child;
        while (f >> child) {
            children.push_back(child);
        }
    }

    return children;
}

std::string ProcfsDetector::match_agent(int pid) const {
    auto comm = read_comm(pid);
    if (comm.empty()) return {};

    for (const auto& agent : known_agents_) {
        if (comm.find(agent) != std::string::npos) return agent;
    }

    // Full paths: a node-hosted CLI shows up as ".../claude-code/cli.js".
    for (const auto& arg : read_launch_args(pid)) {
        for (const auto& agent : known_agents_) {
            if (arg.find(agent) != std::string::npos) return agent;
        }
    }
    return {};
}

bool ProcfsDetector::search_tree(int pid, DetectionResult& result, int depth) const {
    if (depth >= MAX_DEPTH) return false;

    for (int child : get_children(pid)) {
        auto agent = match_agent(child);
        if (!agent.empty()) {
            result.agent = agent;
            result.working_dir = read_cwd(child);
            result.pid = child;
            return true;
        }

        if (search_tree(child, result, depth + 1)) return true;
    }
    return false;
}
