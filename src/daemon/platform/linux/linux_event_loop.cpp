#include "platform/linux/linux_event_loop.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace {

// Output settling and kill deadlines are checked at this granularity.
constexpr long TICK_NS = 100'000'000;

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      transport_(config_.oracle),
      sessions_(config_, launcher_,
                // EventCallback
                [this](const std::string& id, const SessionEvent& event) {
                    core_.on_session_event(id, event);
                },
                // WatchCallback
                [this](int fd, bool watch) { watch_fd(fd, watch); }),
      core_(config_, verbose_, sessions_, transport_, ipc_server_,
            // NotifyCallback
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
}

bool LinuxEventLoop::init(const std::string& endpoint) {
    // epoll first: the session manager registers terminal fds as they appear
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Worker notification eventfd
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // IPC socket
    if (!ipc_server_.start(endpoint)) return false;
    log("IPC listening on " + endpoint);

    // Signal handling via signalfd. SIGCHLD reports agent exits.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGCHLD);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Periodic tick for output settling and the idle watchdog
    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    itimerspec spec{
        .it_interval = {.tv_sec = 0, .tv_nsec = TICK_NS},
        .it_value = {.tv_sec = 0, .tv_nsec = TICK_NS},
    };
    if (timerfd_settime(timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0) return true;
        std::println(stderr, "epoll_ctl failed for fd {}: {}", fd, std::strerror(errno));
        return false;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN) ||
        !add_fd(timer_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                while (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
                    if (info.ssi_signo == SIGCHLD) {
                        sessions_.reap();
                    } else {
                        log("Received signal, shutting down");
                        running_.store(false, std::memory_order_release);
                    }
                }
                continue;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) == sizeof(val)) {
                    core_.on_worker_complete();
                }
                continue;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                if (::read(timer_fd_, &expirations, sizeof(expirations)) == sizeof(expirations)) {
                    sessions_.tick(std::chrono::steady_clock::now());
                    core_.tick(std::chrono::system_clock::now());
                }
                continue;
            }

            if (sessions_.on_readable(fd)) continue;

            if (events[i].events & EPOLLOUT) {
                if (!ipc_server_.flush(fd)) {
                    drop_client(fd);
                    continue;
                }
            }
            if (events[i].events & (EPOLLIN | EPOLLHUP | EPOLLERR)) {
                handle_client(fd);
            }
        }

        core_.flush_broadcasts();
        update_client_writes();
    }

    // Clean shutdown
    core_.shutdown();
    sessions_.stop_all();
    ipc_server_.stop();
}

void LinuxEventLoop::handle_client(int fd) {
    while (true) {
        nlohmann::json cmd;
        auto result = ipc_server_.read_command(fd, cmd);
        if (result == IpcServer::ReadResult::Incomplete) return;

        if (result == IpcServer::ReadResult::Closed) {
            drop_client(fd);
            return;
        }

        std::string cmd_str = cmd.value("cmd", "");
        auto response = core_.handle_command(cmd_str, cmd);
        if (!ipc_server_.send_response(fd, response)) {
            log("Dropping client that stopped reading");
            drop_client(fd);
            return;
        }

        if (response.value("subscribed", false)) {
            core_.add_subscriber(fd);
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
    core_.remove_subscriber(fd);
    write_watched_.erase(fd);
}

void LinuxEventLoop::update_client_writes() {
    for (int fd : ipc_server_.client_fds()) {
        if (!ipc_server_.flush(fd)) {
            drop_client(fd);
            continue;
        }

        bool pending = ipc_server_.has_pending_output(fd);
        if (pending == write_watched_.contains(fd)) continue;

        uint32_t interest = EPOLLIN;
        if (pending) interest |= EPOLLOUT;
        epoll_event ev{.events = interest, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
            std::println(stderr, "epoll_ctl mod client fd {} failed: {}", fd, std::strerror(errno));
            continue;
        }
        if (pending) {
            write_watched_.insert(fd);
        } else {
            write_watched_.erase(fd);
        }
    }
}

void LinuxEventLoop::watch_fd(int fd, bool watch) {
    if (watch) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            std::println(stderr, "epoll_ctl add pty fd {} failed: {}", fd, std::strerror(errno));
        }
    } else {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[agent-herder] {}", msg);
    }
}
