#pragma once

#include <string>

namespace platform {

// Per-user configuration directory for agent-herder, or empty if unknown.
std::string config_dir();

// Per-user state directory (daemon log), or empty if unknown.
std::string state_dir();

// Control socket path.
std::string ipc_endpoint();

// Resolve a program name against PATH (names containing '/' are checked as-is).
// Returns the executable's path, or empty if nothing executable was found.
std::string find_executable(const std::string& name);

} // namespace platform
