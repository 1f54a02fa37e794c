#pragma once

#include "scanner/scanner_config.hpp"

#include <string>
#include <vector>

struct Config {
    ScannerConfig scanner;

    struct Notes {
        std::string path; // empty: platform default
    } notes;

    // Process names that mark an assistant CLI inside a terminal.
    std::vector<std::string> agents = {"claude"};

    static Config load(const std::string& path);
    static Config load_default();

    // Fill empty paths with the platform defaults.
    void resolve_paths();
};
