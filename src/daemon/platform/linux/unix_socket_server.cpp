#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    socket_path_ = endpoint;

    // Remove stale socket
    ::unlink(endpoint.c_str());

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
    ::chmod(endpoint.c_str(), 0600);

    if (::listen(server_fd_, 8) < 0) {
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
    clients_.push_back({fd, {}});
    return fd;
}

IpcServer::ReadStatus UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto* client = find_client(client_fd);
    if (!client) return ReadStatus::Closed;

    // A previous read may already hold a complete line.
    if (client->buf.find('\n') == std::string::npos) {
        char buf[4096];
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0 && (errno == EAGAIN || errno == EINTR)) return ReadStatus::Partial;
        if (n <= 0) return ReadStatus::Closed;
        client->buf.append(buf, static_cast<size_t>(n));
    }

    auto pos = client->buf.find('\n');
    if (pos == std::string::npos) {
        if (client->buf.size() > kMaxLine) {
            std::println(stderr, "ipc: client {} sent an oversized command", client_fd);
            return ReadStatus::Closed;
        }
        return ReadStatus::Partial;
    }

    std::string line = client->buf.substr(0, pos);
    client->buf.erase(0, pos + 1);

    try {
        cmd = nlohmann::json::parse(line);
        return ReadStatus::Command;
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "ipc: bad command from client {}: {}", client_fd, e.what());
        return ReadStatus::Closed;
    }
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    ssize_t sent = ::send(client_fd, msg.data(), msg.size(), MSG_NOSIGNAL);
    return sent == static_cast<ssize_t>(msg.size());
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
