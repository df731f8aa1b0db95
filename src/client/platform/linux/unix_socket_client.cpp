#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::UnixSocketClient() = default;

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    close();
    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        close();
        return false;
    }
    endpoint.copy(addr.sun_path, sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        close();
        return false;
    }
    return true;
}

bool UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return false;
    std::string msg = cmd.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t n = ::send(fd_, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += static_cast<size_t>(n);
    }
    return true;
}

std::expected<nlohmann::json, std::string> UnixSocketClient::recv(std::chrono::milliseconds timeout) {
    if (buf_.find('\n') != std::string::npos) return pop_line();
    if (fd_ < 0) return std::unexpected(std::string("not connected"));

    auto deadline = std::chrono::steady_clock::now() + timeout;
    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};

    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return std::unexpected(std::string("timed out waiting for reply"));

        int ret = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ret < 0 && errno == EINTR) continue;
        if (ret < 0) return std::unexpected(std::string("poll failed: ") + std::strerror(errno));
        if (ret == 0) return std::unexpected(std::string("timed out waiting for reply"));

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return std::unexpected(std::string("daemon closed the connection"));

        buf_.append(tmp, static_cast<size_t>(n));
        if (buf_.find('\n') != std::string::npos) return pop_line();
    }
}

std::expected<nlohmann::json, std::string> UnixSocketClient::pop_line() {
    auto pos = buf_.find('\n');
    std::string line = buf_.substr(0, pos);
    buf_.erase(0, pos + 1);
    try {
        return nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string("malformed reply: ") + e.what());
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buf_.clear();
}
