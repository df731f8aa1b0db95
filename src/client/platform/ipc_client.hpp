#pragma once

#include <chrono>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Line-delimited JSON connection to the daemon. Each command gets exactly one
// reply line. stop, and toggle while recording, are answered with the session
// summary once the pipeline has finished.
class IpcClient {
public:
    virtual ~IpcClient() = default;

    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;

    // Waits up to `timeout` in total for the next reply. Replies that arrive
    // in one read are handed out one per call.
    virtual std::expected<nlohmann::json, std::string> recv(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;

    // Sends `cmd` and waits for its reply.
    std::expected<nlohmann::json, std::string> request(const nlohmann::json& cmd);

    // How long `cmd` may take to answer; commands that end a session wait for it.
    static std::chrono::milliseconds reply_timeout(const nlohmann::json& cmd);
};
