#include "platform/ipc_client.hpp"

namespace {

constexpr std::chrono::milliseconds kReplyTimeout{10'000};
// Covers the longest manual recording plus transcription and delivery.
constexpr std::chrono::milliseconds kSessionReplyTimeout{180'000};

} // namespace

std::chrono::milliseconds IpcClient::reply_timeout(const nlohmann::json& cmd) {
    auto name = cmd.value("cmd", std::string());
    if (name == "stop" || name == "toggle") return kSessionReplyTimeout;
    return kReplyTimeout;
}

std::expected<nlohmann::json, std::string> IpcClient::request(const nlohmann::json& cmd) {
    if (!send(cmd)) return std::unexpected(std::string("failed to send command"));
    return recv(reply_timeout(cmd));
}
