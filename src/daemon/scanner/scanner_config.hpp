#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct ScannerConfig {
    std::string projects_dir;               // empty: platform default
    uint32_t active_threshold_s = 600;      // older logs are not reported at all
    uint32_t idle_threshold_s = 300;        // older logs are reported as idle
    std::string subagent_prefix = "agent-";
    std::string log_extension = ".jsonl";
    std::string question_tool = "AskUserQuestion";
    size_t lookback_lines = 10;             // tail window for last-tool recovery
};
