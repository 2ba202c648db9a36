#include "platform/daemonizer.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

void redirect(int target, const char* path, int flags) {
    int fd = ::open(path, flags | O_CLOEXEC, 0600);
    if (fd < 0) fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (fd < 0) return;
    ::dup2(fd, target);
    ::close(fd);
}

} // namespace

void daemonize(const std::string& log_file) {
    pid_t pid = ::fork();
    if (pid < 0) {
        std::println(stderr, "daemon: fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    if (::setsid() < 0) {
        std::println(stderr, "daemon: setsid() failed: {}", std::strerror(errno));
        _exit(1);
    }
    ::signal(SIGHUP, SIG_IGN);

    // Second fork: a non-leader can never reacquire a controlling terminal
    pid = ::fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    // The control socket can start arbitrary programs; keep it private.
    ::umask(077);
    if (::chdir("/") < 0) _exit(1);

    redirect(STDIN_FILENO, "/dev/null", O_RDONLY);
    const char* out = log_file.empty() ? "/dev/null" : log_file.c_str();
    redirect(STDOUT_FILENO, out, O_WRONLY | O_CREAT | O_APPEND);
    redirect(STDERR_FILENO, out, O_WRONLY | O_CREAT | O_APPEND);
}

} // namespace platform
