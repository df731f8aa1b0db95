#include "command_builder.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Dictation:");
    std::println(stderr, "  start | stop | toggle | cancel     Control a recording");
    std::println(stderr, "  wake [--score S] [--model NAME]    Report a wake-word detection");
    std::println(stderr, "  status                             Show daemon status");
    std::println(stderr, "  history [--limit N]                Show recent sessions");
    std::println(stderr, "  report [today|YYYY-MM-DD|list]     Markdown activity report");
    std::println(stderr, "Settings:");
    std::println(stderr, "  set_mode raw|corrected|both        Choose what gets typed");
    std::println(stderr, "  set_correction on|off              Toggle the correction stage");
    std::println(stderr, "  teach \"term, term\"                 Add vocabulary hints");
    std::println(stderr, "  add_correction WRONG RIGHT         Add a dictionary replacement");
    std::println(stderr, "  settings                           Show current settings");
    std::println(stderr, "Speech:");
    std::println(stderr, "  speak TEXT [--event TYPE] [--remind] [--no-summarize]");
    std::println(stderr, "  speech_cancel | reminder_cancel | speech_enable | speech_disable");
    std::println(stderr, "  set_voice VOICE | speech_status");
}

static void print_response(const std::string& command, const json& response) {
    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        std::println("Device: {}", response.value("device", "unknown"));
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
        std::println("Output mode: {}", response.value("output_mode", ""));
        std::println("Correction: {}", response.value("correction_enabled", false) ? "on" : "off");
    } else if (command == "history") {
        for (auto& entry : response.value("entries", json::array())) {
            std::println("[{}] {} {}", entry.value("timestamp", ""), entry.value("outcome", ""),
                         entry.value("text", ""));
        }
    } else if (command == "report") {
        std::print("{}", response.value("report", ""));
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    } else if (response.contains("message")) {
        std::println("{}", response["message"].get<std::string>());
    } else {
        std::println("{}", response.dump(2));
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args[0] == "--help" || args[0] == "-h") {
        usage(argv[0]);
        return 0;
    }

    auto cmd = build_command(args);
    if (!cmd) {
        std::println(stderr, "{}", cmd.error());
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is push-dictate running?");
        return 1;
    }

    auto response = client.request(*cmd);
    if (!response) {
        std::println(stderr, "No response from daemon: {}", response.error());
        return 1;
    }

    if (response->value("status", "") == "error") {
        std::println(stderr, "Error: {}", response->value("message", "unknown error"));
        return 1;
    }

    print_response(args[0], *response);
    return 0;
}
