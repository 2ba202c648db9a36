#include "platform/linux/pty_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

PtyProcess::PtyProcess(int master_fd, pid_t pid)
    : master_fd_(master_fd), pid_(pid) {}

PtyProcess::~PtyProcess() {
    if (master_fd_ >= 0) ::close(master_fd_);

    if (!exit_code_) {
        signal_group(SIGKILL);
        ::waitpid(pid_, nullptr, 0);
    }
}

ssize_t PtyProcess::read(char* buf, size_t len) {
    while (true) {
        ssize_t n = ::read(master_fd_, buf, len);
        if (n >= 0) return n;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return -1;
        // EIO: the slave side has been closed by the exiting child.
        return 0;
    }
}

ssize_t PtyProcess::write(std::string_view data) {
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = ::write(master_fd_, data.data() + total, data.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            // Input queue full: the caller keeps the rest for later.
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            return total > 0 ? static_cast<ssize_t>(total) : -1;
        }
        total += static_cast<size_t>(n);
    }
    return static_cast<ssize_t>(total);
}

void PtyProcess::terminate() {
    signal_group(SIGTERM);
}

void PtyProcess::kill() {
    signal_group(SIGKILL);
}

std::optional<int> PtyProcess::try_reap() {
    if (exit_code_) return exit_code_;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            return std::nullopt;
        }
    } else if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing more will be known.
        exit_code_ = -1;
    }
    return exit_code_;
}

void PtyProcess::signal_group(int sig) {
    if (exit_code_) return;
    // forkpty makes the child a session leader, so its pid is the group id.
    if (::kill(-pid_, sig) < 0) {
        ::kill(pid_, sig);
    }
}

std::expected<std::unique_ptr<TerminalProcess>, std::string>
PtyLauncher::launch(const LaunchSpec& spec) {
    // Everything the child needs is built before fork; only exec-safe calls after.
    std::vector<std::string> argv_store;
    argv_store.push_back(spec.program);
    argv_store.insert(argv_store.end(), spec.args.begin(), spec.args.end());

    std::vector<char*> argv;
    for (auto& a : argv_store) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::map<std::string, std::string> env_map;
    for (char** e = environ; e && *e; ++e) {
        std::string_view kv(*e);
        auto eq = kv.find('=');
        if (eq == std::string_view::npos) continue;
        env_map[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
    }
    env_map["TERM"] = "xterm-256color";
    for (auto& [k, v] : spec.env) env_map[k] = v;

    std::vector<std::string> env_store;
    for (auto& [k, v] : env_map) env_store.push_back(k + "=" + v);
    std::vector<char*> envp;
    for (auto& e : env_store) envp.push_back(e.data());
    envp.push_back(nullptr);

    winsize ws{};
    ws.ws_col = spec.cols;
    ws.ws_row = spec.rows;

    int master = -1;
    pid_t pid = ::forkpty(&master, nullptr, nullptr, &ws);
    if (pid < 0) {
        return std::unexpected(std::format("forkpty failed: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        // The daemon blocks its signals for signalfd; the child must not inherit that.
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        if (!spec.workdir.empty() && ::chdir(spec.workdir.c_str()) != 0) {
            _exit(127);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    int flags = ::fcntl(master, F_GETFL);
    ::fcntl(master, F_SETFL, flags | O_NONBLOCK);
    ::fcntl(master, F_SETFD, FD_CLOEXEC);

    return std::make_unique<PtyProcess>(master, pid);
}
