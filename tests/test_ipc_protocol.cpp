#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

std::string tmp_socket_path() {
    return "/tmp/pd_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// The server socket is non-blocking, so poll briefly for a full line.
IpcServer::ReadStatus read_with_retry(UnixSocketServer& server, int fd, json& out) {
    auto status = IpcServer::ReadStatus::Partial;
    for (int i = 0; i < 200 && status == IpcServer::ReadStatus::Partial; ++i) {
        status = server.read_command(fd, out);
        if (status == IpcServer::ReadStatus::Partial) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    return status;
}

int accept_with_retry(UnixSocketServer& server) {
    for (int i = 0; i < 200; ++i) {
        int fd = server.accept_client();
        if (fd >= 0) return fd;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return -1;
}

// Connects a bare socket so tests can send malformed or split input.
int raw_connect(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    path.copy(addr.sun_path, sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

void raw_send(int fd, const std::string& data) {
    ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));

        struct stat st{};
        REQUIRE(::stat(sock_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);

        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("RestartOnSamePath") {
        {
            UnixSocketServer first;
            REQUIRE(first.start(sock_path));
        }
        UnixSocketServer second;
        REQUIRE(second.start(sock_path));
        second.stop();
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "status"}}));

        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == IpcServer::ReadStatus::Command);
        REQUIRE(received["cmd"] == "status");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"state", "idle"}}));

        auto client_resp = client.recv(1000ms);
        REQUIRE(client_resp);
        REQUIRE((*client_resp)["state"] == "idle");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("MultipleMessages") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"cmd", "status"}, {"seq", i}}));

            json received;
            REQUIRE(read_with_retry(server, client_fd, received) == IpcServer::ReadStatus::Command);
            REQUIRE(received["seq"] == i);

            REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"seq", i}}));

            auto client_resp = client.recv(1000ms);
            REQUIRE(client_resp);
            REQUIRE((*client_resp)["seq"] == i);
        }

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("SplitLineIsReassembled") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        raw_send(raw, R"({"cmd":"sp)");
        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == IpcServer::ReadStatus::Partial);

        raw_send(raw, "eak\",\"text\":\"hi\"}\n");
        REQUIRE(read_with_retry(server, client_fd, received) == IpcServer::ReadStatus::Command);
        REQUIRE(received["cmd"] == "speak");
        REQUIRE(received["text"] == "hi");

        ::close(raw);
        server.stop();
    }

    SECTION("PipelinedCommandsAreBuffered") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        raw_send(raw, "{\"cmd\":\"start\"}\n{\"cmd\":\"stop\"}\n");

        json first;
        REQUIRE(read_with_retry(server, client_fd, first) == IpcServer::ReadStatus::Command);
        REQUIRE(first["cmd"] == "start");

        json second;
        REQUIRE(server.read_command(client_fd, second) == IpcServer::ReadStatus::Command);
        REQUIRE(second["cmd"] == "stop");

        ::close(raw);
        server.stop();
    }

    SECTION("MalformedJsonClosesClient") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        raw_send(raw, "not json\n");
        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == IpcServer::ReadStatus::Closed);

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        client.close();

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == IpcServer::ReadStatus::Closed);

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ClientFailsWithoutServer") {
        std::filesystem::remove(sock_path);
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path));
        REQUIRE_FALSE(client.send({{"cmd", "status"}}));
    }

    SECTION("RecvTimesOut") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        auto start = std::chrono::steady_clock::now();
        auto resp = client.recv(50ms);
        REQUIRE_FALSE(resp);
        REQUIRE(resp.error() == "timed out waiting for reply");
        REQUIRE(std::chrono::steady_clock::now() - start < 1s);
        server.stop();
    }

    SECTION("RepliesArrivingTogetherAreKept") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"seq", 1}}));
        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"seq", 2}}));
        std::this_thread::sleep_for(20ms);

        auto first = client.recv(1000ms);
        REQUIRE(first);
        REQUIRE((*first)["seq"] == 1);
        // Already buffered, so no wait is needed.
        auto second = client.recv(0ms);
        REQUIRE(second);
        REQUIRE((*second)["seq"] == 2);

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("RequestWaitsForLateReply") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        std::expected<json, std::string> reply;
        std::jthread requester([&] { reply = client.request({{"cmd", "stop"}}); });

        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == IpcServer::ReadStatus::Command);
        REQUIRE(received["cmd"] == "stop");
        // The summary follows only once the session has been processed.
        std::this_thread::sleep_for(100ms);
        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"outcome", "completed"}}));
        requester.join();

        REQUIRE(reply);
        REQUIRE((*reply)["outcome"] == "completed");

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ServerClosingIsReported") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);
        server.close_client(client_fd);

        auto resp = client.recv(1000ms);
        REQUIRE_FALSE(resp);
        REQUIRE(resp.error() == "daemon closed the connection");
        server.stop();
    }

    SECTION("MalformedReply") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = accept_with_retry(server);
        REQUIRE(client_fd >= 0);

        raw_send(client_fd, "oops\n{\"status\":\"ok\"}\n");
        auto bad = client.recv(1000ms);
        REQUIRE_FALSE(bad);
        REQUIRE(bad.error().starts_with("malformed reply"));
        auto good = client.recv(1000ms);
        REQUIRE(good);
        REQUIRE((*good)["status"] == "ok");

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("RequestWithoutConnection") {
        UnixSocketClient client;
        auto resp = client.request({{"cmd", "status"}});
        REQUIRE_FALSE(resp);
        REQUIRE(resp.error() == "failed to send command");
    }
}

TEST_CASE("Reply timeouts", "[ipc]") {
    REQUIRE(IpcClient::reply_timeout(json{{"cmd", "status"}}) == 10s);
    // Session-ending commands outlast the longest manual recording.
    REQUIRE(IpcClient::reply_timeout(json{{"cmd", "stop"}}) > 120s);
    REQUIRE(IpcClient::reply_timeout(json{{"cmd", "toggle"}}) > 120s);
    REQUIRE(IpcClient::reply_timeout(json::object()) == 10s);
}
