#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <string_view>
#include <unistd.h>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/agent-herder";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/agent-herder";
}

std::string state_dir() {
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg) return std::string(xdg) + "/agent-herder";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/state/agent-herder";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/agent-herder.sock";
    return "/tmp/agent-herder.sock";
}

std::string find_executable(const std::string& name) {
    if (name.empty()) return {};
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : std::string{};
    }

    const char* path_env = std::getenv("PATH");
    std::string_view path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    while (!path.empty()) {
        auto sep = path.find(':');
        auto dir = path.substr(0, sep);
        if (dir.empty()) dir = ".";

        std::string candidate = std::string(dir) + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) return candidate;

        if (sep == std::string_view::npos) break;
        path.remove_prefix(sep + 1);
    }
    return {};
}

} // namespace platform
