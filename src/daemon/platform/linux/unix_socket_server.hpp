#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    ReadResult read_command(int client_fd, nlohmann::json& cmd) override;
    // Queues the reply and sends as much as the socket takes. False once the
    // client is gone or has fallen more than MAX_PENDING_OUTPUT behind.
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

    // Send queued output. False if the client has failed and should be closed.
    bool flush(int client_fd);
    bool has_pending_output(int client_fd) const;
    std::vector<int> client_fds() const;

    static constexpr size_t MAX_PENDING_OUTPUT = 16 * 1024 * 1024;

private:
    int server_fd_ = -1;
    std::string socket_path_;

    struct ClientBuffer {
        int fd;
        std::string buf;
        std::string out;     // replies not yet taken by the socket
        bool failed = false;
    };
    std::vector<ClientBuffer> clients_;

    ClientBuffer* find_client(int fd);
    const ClientBuffer* find_client(int fd) const;
    bool flush_client(ClientBuffer& client);
};
