#pragma once

#include <string>

namespace platform {

// Detach from the controlling terminal. Returns only in the daemon process.
// stdout/stderr are appended to `log_file` (or discarded if it is empty or
// cannot be opened), so verbose logging keeps working in the background.
void daemonize(const std::string& log_file);

} // namespace platform
