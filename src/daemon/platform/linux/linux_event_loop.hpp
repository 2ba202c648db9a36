#pragma once

#include "config.hpp"
#include "coordinator.hpp"
#include "oracle/http_transport.hpp"
#include "platform/linux/pty_process.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "session_manager.hpp"

#include <atomic>
#include <string>
#include <unordered_set>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    // Sets up epoll, signals, the tick timer and the control socket at `endpoint`.
    bool init(const std::string& endpoint);
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);
    // Watch clients with queued replies for EPOLLOUT; close failed ones.
    void update_client_writes();
    void watch_fd(int fd, bool watch);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    PtyLauncher launcher_;
    UnixSocketServer ipc_server_;
    HttpModelTransport transport_;
    SessionManager sessions_;

    // Portable business logic
    Coordinator core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int timer_fd_ = -1;
    std::unordered_set<int> write_watched_;

    std::atomic<bool> running_{false};
};
