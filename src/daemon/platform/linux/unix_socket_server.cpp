#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

// Pop the first complete line from `buf` and parse it. Malformed lines are dropped.
bool take_command(std::string& buf, nlohmann::json& cmd) {
    while (true) {
        auto pos = buf.find('\n');
        if (pos == std::string::npos) return false;

        std::string line = buf.substr(0, pos);
        buf.erase(0, pos + 1);

        try {
            cmd = nlohmann::json::parse(line);
            return true;
        } catch (const nlohmann::json::exception& e) {
            std::println(stderr, "ipc: dropping malformed command: {}", e.what());
        }
    }
}

// A daemon is still serving `path` if something accepts a connection there.
bool socket_in_use(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    bool live = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return live;
}

} // namespace

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    if (socket_in_use(endpoint)) {
        std::println(stderr, "ipc: another daemon is listening on {}", endpoint);
        return false;
    }

    // Remove stale socket
    ::unlink(endpoint.c_str());
    socket_path_ = endpoint;

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long");
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 16) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({.fd = fd});
    return fd;
}

IpcServer::ReadResult UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto* client = find_client(client_fd);
    if (!client) return ReadResult::Closed;

    if (take_command(client->buf, cmd)) return ReadResult::Command;

    char buf[4096];
    ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n == 0) return ReadResult::Closed;
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return ReadResult::Incomplete;
        return ReadResult::Closed;
    }

    client->buf.append(buf, static_cast<size_t>(n));
    return take_command(client->buf, cmd) ? ReadResult::Command : ReadResult::Incomplete;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    auto* client = find_client(client_fd);
    if (!client || client->failed) return false;

    // Session output may carry invalid UTF-8; it is replaced, not thrown on.
    std::string msg = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    msg += '\n';

    if (client->out.size() + msg.size() > MAX_PENDING_OUTPUT) {
        std::println(stderr, "ipc: client {} is not reading, dropping it", client_fd);
        client->failed = true;
        client->out.clear();
        return false;
    }
    client->out += msg;
    return flush_client(*client);
}

bool UnixSocketServer::flush(int client_fd) {
    auto* client = find_client(client_fd);
    return client && flush_client(*client);
}

bool UnixSocketServer::has_pending_output(int client_fd) const {
    auto* client = find_client(client_fd);
    return client && !client->out.empty();
}

std::vector<int> UnixSocketServer::client_fds() const {
    std::vector<int> fds;
    fds.reserve(clients_.size());
    for (auto& c : clients_) fds.push_back(c.fd);
    return fds;
}

bool UnixSocketServer::flush_client(ClientBuffer& client) {
    if (client.failed) return false;

    size_t off = 0;
    while (off < client.out.size()) {
        ssize_t n = ::send(client.fd, client.out.data() + off, client.out.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            client.failed = true;
            client.out.clear();
            return false;
        }
        off += static_cast<size_t>(n);
    }
    client.out.erase(0, off);
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    if (!find_client(client_fd)) return;
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}

const UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) const {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
