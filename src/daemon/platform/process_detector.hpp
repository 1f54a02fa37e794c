#pragma once

#include <string>

struct DetectionResult {
    std::string agent;       // matched agent name, e.g. "claude"
    std::string working_dir; // agent's cwd
    int pid = 0;             // agent process
};

class ProcessDetector {
public:
    virtual ~ProcessDetector() = default;
    // Search the process tree below pid for a known assistant CLI.
    virtual DetectionResult detect(int pid) const = 0;
};
