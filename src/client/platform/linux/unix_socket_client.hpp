#pragma once

#include "platform/ipc_client.hpp"

#include <string>

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    std::expected<nlohmann::json, std::string> recv(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    std::expected<nlohmann::json, std::string> pop_line();

    int fd_ = -1;
    std::string buf_; // bytes received past the last complete reply
};
