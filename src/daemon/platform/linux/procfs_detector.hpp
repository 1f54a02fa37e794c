#pragma once

#include "platform/process_detector.hpp"

#include <string>
#include <vector>

class ProcfsDetector : public ProcessDetector {
public:
    explicit ProcfsDetector(std::vector<std::string> known_agents);

    DetectionResult detect(int pid) const override;

private:
    static std::string read_comm(int pid);
    static std::string read_cwd(int pid);
    // argv[0] and argv[1]; script-hosted CLIs (node, python) name themselves in argv[1].
    static std::vector<std::string> read_launch_args(int pid);
    static std::vector<int> get_children(int pid);

    // Known agent name matching this process, or empty.
    std::string match_agent(int pid) const;
    bool search_tree(int pid, DetectionResult& result, int depth) const;

    static constexpr int MAX_DEPTH = 16;

    std::vector<std::string> known_agents_;
};
