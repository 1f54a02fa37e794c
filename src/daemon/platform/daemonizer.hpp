#pragma once

namespace platform {

// Detach from the controlling terminal: double fork, new session, stdio on
// /dev/null. Returns only in the final child; false if stdio could not be
// redirected. The intermediate processes exit.
bool daemonize();

} // namespace platform
