#pragma once

#include <string>

namespace platform {

// Directory holding config.json. Empty if no home directory is known.
std::string config_dir();

// Root of the per-project session log directories.
std::string projects_dir();

// Operator notes document appended to by the add-note command.
std::string notes_path();

// Address the daemon listens on and the client connects to.
std::string ipc_endpoint();

} // namespace platform
