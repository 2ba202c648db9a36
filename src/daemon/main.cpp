#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <print>
#include <string>
#include <system_error>

namespace {

void print_usage() {
    std::println("Usage: agent-herder [options]");
    std::println("Supervise coding-agent sessions in pseudo-terminals.");
    std::println("Options:");
    std::println("  -f, --foreground    Run in foreground (don't daemonize)");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -l, --log PATH      Daemon log file (default: {}/daemon.log)", platform::state_dir());
    std::println("  -s, --socket PATH   Control socket (default: {})", platform::ipc_endpoint());
    std::println("  -h, --help          Show this help");
}

std::string default_log_file() {
    auto dir = platform::state_dir();
    if (dir.empty()) return {};

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::println(stderr, "daemon: cannot create {}: {}", dir, ec.message());
        return {};
    }
    return dir + "/daemon.log";
}

} // namespace

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;
    std::string log_file;
    std::string socket_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--log" || arg == "-l") && i + 1 < argc) {
            log_file = argv[++i];
        } else if ((arg == "--socket" || arg == "-s") && i + 1 < argc) {
            socket_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            print_usage();
            return 2;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (socket_path.empty()) socket_path = platform::ipc_endpoint();

    if (!foreground) {
        platform::daemonize(log_file.empty() ? default_log_file() : log_file);
    }

    if (verbose) {
        std::println(stderr, "[agent-herder] Starting (oracle: {} @ {}, supervision: {}, {} agent profiles)",
                     config.oracle.model, config.oracle.url, config.coordinator.supervision,
                     config.agents.size());
    }

    LinuxEventLoop loop(std::move(config), verbose);
    if (!loop.init(socket_path)) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
