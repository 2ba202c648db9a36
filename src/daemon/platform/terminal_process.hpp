#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

struct LaunchSpec {
    std::string program;
    std::vector<std::string> args;
    std::string workdir;
    std::map<std::string, std::string> env;  // added to (or overriding) the daemon's environment
    uint16_t cols = 200;
    uint16_t rows = 50;
};

// A child process attached to a pseudo-terminal.
class TerminalProcess {
public:
    virtual ~TerminalProcess() = default;

    // Non-blocking master fd, for readiness polling.
    virtual int fd() const = 0;
    virtual pid_t pid() const = 0;

    // > 0: bytes read. 0: end of output (child hung up). < 0: nothing available right now.
    virtual ssize_t read(char* buf, size_t len) = 0;

    // Write as much of `data` as the terminal accepts without blocking.
    // Returns the byte count (0 when the child is not reading), or -1 if the
    // terminal is gone.
    virtual ssize_t write(std::string_view data) = 0;

    // SIGTERM / SIGKILL the child's process group.
    virtual void terminate() = 0;
    virtual void kill() = 0;

    // Exit code once the child has exited (128 + signal for signal deaths).
    virtual std::optional<int> try_reap() = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;
    virtual std::expected<std::unique_ptr<TerminalProcess>, std::string> launch(const LaunchSpec& spec) = 0;
};
