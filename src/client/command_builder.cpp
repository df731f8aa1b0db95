#include "command_builder.hpp"

#include <charconv>

using json = nlohmann::json;

namespace {

// Looks for "--name value" after the command word.
std::string option(const std::vector<std::string>& args, const std::string& name,
                   const std::string& fallback = {}) {
    for (size_t i = 1; i + 1 < args.size(); ++i) {
        if (args[i] == name) return args[i + 1];
    }
    return fallback;
}

bool flag(const std::vector<std::string>& args, const std::string& name) {
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i] == name) return true;
    }
    return false;
}

// Words after the command that are not options or option values.
std::string positional(const std::vector<std::string>& args) {
    std::string out;
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i].starts_with("--")) {
            if (args[i] != "--remind" && args[i] != "--no-summarize") ++i;
            continue;
        }
        if (!out.empty()) out += ' ';
        out += args[i];
    }
    return out;
}

} // namespace

std::expected<json, std::string> build_command(const std::vector<std::string>& args) {
    if (args.empty()) return std::unexpected("missing command");
    const auto& command = args[0];

    static const std::vector<std::string> simple = {
        "start", "stop", "toggle", "cancel", "status", "settings",
        "speech_cancel", "speech_enable", "speech_disable", "speech_status", "reminder_cancel",
    };
    for (auto& s : simple) {
        if (command == s) return json{{"cmd", command}};
    }

    if (command == "history") {
        int limit = 10;
        auto value = option(args, "--limit", "10");
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), limit);
        if (ec != std::errc{} || limit <= 0) return std::unexpected("--limit must be a positive number");
        return json{{"cmd", "history"}, {"limit", limit}};
    }
    if (command == "report") {
        auto date = positional(args);
        return json{{"cmd", "report"}, {"date", date.empty() ? "today" : date}};
    }
    if (command == "wake") {
        auto score = option(args, "--score", "1.0");
        try {
            return json{{"cmd", "wake"}, {"score", std::stod(score)},
                        {"model", option(args, "--model", "wake")}};
        } catch (const std::exception&) {
            return std::unexpected("--score must be a number");
        }
    }
    if (command == "set_mode" || command == "mode") {
        auto mode = positional(args);
        if (mode.empty()) return std::unexpected("usage: set_mode raw|corrected|both");
        return json{{"cmd", "set_mode"}, {"mode", mode}};
    }
    if (command == "set_correction") {
        auto value = positional(args);
        if (value != "on" && value != "off") return std::unexpected("usage: set_correction on|off");
        return json{{"cmd", "set_correction"}, {"enabled", value == "on"}};
    }
    if (command == "teach") {
        auto terms = positional(args);
        if (terms.empty()) return std::unexpected("usage: teach \"term, term, ...\"");
        return json{{"cmd", "teach"}, {"terms", terms}};
    }
    if (command == "add_correction") {
        if (args.size() != 3) return std::unexpected("usage: add_correction WRONG RIGHT");
        return json{{"cmd", "add_correction"}, {"wrong", args[1]}, {"right", args[2]}};
    }
    if (command == "speak") {
        auto text = positional(args);
        if (text.empty()) return std::unexpected("usage: speak TEXT [--event TYPE] [--remind] [--no-summarize]");
        return json{{"cmd", "speak"}, {"text", text},
                    {"event_type", option(args, "--event", "notification")},
                    {"summarize", !flag(args, "--no-summarize")},
                    {"start_reminder", flag(args, "--remind")}};
    }
    if (command == "set_voice") {
        auto voice = positional(args);
        if (voice.empty()) return std::unexpected("usage: set_voice VOICE");
        return json{{"cmd", "set_voice"}, {"voice", voice}};
    }
    return std::unexpected("unknown command: " + command);
}
