#pragma once

#include "platform/terminal_process.hpp"

class PtyProcess : public TerminalProcess {
public:
    PtyProcess(int master_fd, pid_t pid);
    ~PtyProcess() override;

    PtyProcess(const PtyProcess&) = delete;
    PtyProcess& operator=(const PtyProcess&) = delete;

    int fd() const override { return master_fd_; }
    pid_t pid() const override { return pid_; }

    ssize_t read(char* buf, size_t len) override;
    ssize_t write(std::string_view data) override;
    void terminate() override;
    void kill() override;
    std::optional<int> try_reap() override;

private:
    void signal_group(int sig);

    int master_fd_;
    pid_t pid_;
    std::optional<int> exit_code_;
};

// forkpty(3)-based launcher. The child gets its own session and process
// group, TERM=xterm-256color and the requested window size.
class PtyLauncher : public ProcessLauncher {
public:
    std::expected<std::unique_ptr<TerminalProcess>, std::string> launch(const LaunchSpec& spec) override;
};
