#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

// Plain-text views of daemon responses for the terminal.

// "45s", "3m05s", "1h02m"
std::string format_idle(int64_t seconds);

// Summary line, waiting projects, then one row per session.
std::string render_sessions(const nlohmann::json& report);

std::string render_windows(const nlohmann::json& resp);
