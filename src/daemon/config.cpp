#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Non-negative integer field. Anything else keeps the current value.
template <typename T>
void read_unsigned(const json& obj, const char* key, T& out) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (!v.is_number_unsigned() || v.get<uint64_t>() > std::numeric_limits<T>::max()) {
        std::println(stderr, "config: {} must be a non-negative integer, keeping {}", key, out);
        return;
    }
    out = v.get<T>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        cfg.resolve_paths();
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("scanner")) {
            auto& s = j["scanner"];
            auto& sc = cfg.scanner;
            if (s.contains("projects_dir")) sc.projects_dir = s["projects_dir"].get<std::string>();
            read_unsigned(s, "active_threshold_s", sc.active_threshold_s);
            read_unsigned(s, "idle_threshold_s", sc.idle_threshold_s);
            if (s.contains("subagent_prefix")) sc.subagent_prefix = s["subagent_prefix"].get<std::string>();
            if (s.contains("log_extension")) sc.log_extension = s["log_extension"].get<std::string>();
            if (s.contains("question_tool")) sc.question_tool = s["question_tool"].get<std::string>();
            read_unsigned(s, "lookback_lines", sc.lookback_lines);
        }

        if (j.contains("notes")) {
            auto& n = j["notes"];
            if (n.contains("path")) cfg.notes.path = n["path"].get<std::string>();
        }

        if (j.contains("agents")) {
            cfg.agents = j["agents"].get<std::vector<std::string>>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    if (cfg.scanner.idle_threshold_s > cfg.scanner.active_threshold_s) {
        std::println(stderr, "config: idle_threshold_s {} exceeds active_threshold_s {}, idle state unreachable",
                     cfg.scanner.idle_threshold_s, cfg.scanner.active_threshold_s);
    }

    cfg.resolve_paths();
    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (!dir.empty()) {
        auto config_path = fs::path(dir) / "config.json";
        if (fs::exists(config_path)) {
            return load(config_path.string());
        }
    }

    Config cfg;
    cfg.resolve_paths();
    return cfg;
}

void Config::resolve_paths() {
    if (scanner.projects_dir.empty()) scanner.projects_dir = platform::projects_dir();
    if (notes.path.empty()) notes.path = platform::notes_path();
}
