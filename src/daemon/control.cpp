#include "control.hpp"

#include "pipeline/text_rules.hpp"
#include "storage/report.hpp"

#include <format>
#include <print>

namespace {

nlohmann::json error(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

} // namespace

Control::Control(Deps deps, bool verbose)
    : deps_(deps), verbose_(verbose) {}

Control::Reply Control::handle(const nlohmann::json& cmd) {
    if (!cmd.is_object() || !cmd.contains("cmd") || !cmd["cmd"].is_string()) {
        return {error("missing cmd field")};
    }

    std::string name = cmd["cmd"].get<std::string>();
    log("command: " + name);

    try {
        if (name == "start") return handle_start();
        if (name == "stop") return handle_stop();
        if (name == "toggle") return handle_toggle();
        if (name == "cancel") return {handle_cancel()};
        if (name == "wake") return {handle_wake(cmd)};
        if (name == "status") return {deps_.orchestrator.status()};
        if (name == "history") return {handle_history(cmd)};
        if (name == "report") return {handle_report(cmd)};
        if (name == "set_mode") return {handle_set_mode(cmd)};
        if (name == "set_correction") return {handle_set_correction(cmd)};
        if (name == "teach") return {handle_teach(cmd)};
        if (name == "add_correction") return {handle_add_correction(cmd)};
        if (name == "settings") {
            auto body = settings_json(*deps_.settings.snapshot());
            body["status"] = "ok";
            return {body};
        }
        if (name.starts_with("speak") || name.starts_with("speech_") ||
            name == "reminder_cancel" || name == "set_voice") {
            return {handle_speech(name, cmd)};
        }
    } catch (const nlohmann::json::exception& e) {
        return {error(std::string("bad arguments: ") + e.what())};
    }
    return {error("unknown command")};
}

// --- Session control ---

Control::Reply Control::handle_start() {
    auto r = deps_.orchestrator.on_trigger(TriggerEvent::start(TriggerSource::Control));
    if (!r.accepted) return {error("cannot start: " + r.reason)};
    return {{{"status", "ok"}, {"message", "recording"},
             {"session_id", deps_.orchestrator.session_id().value_or(0)}}};
}

Control::Reply Control::handle_stop() {
    if (deps_.orchestrator.state() != SessionState::Recording) {
        return {error("not recording")};
    }
    double duration = deps_.orchestrator.recording_duration();
    auto r = deps_.orchestrator.on_trigger(TriggerEvent::stop(TriggerSource::Control));
    if (!r.accepted) return {error("cannot stop: " + r.reason)};

    // The stop may have finished the session on the spot (too short, silent).
    if (deps_.orchestrator.state() == SessionState::Idle) {
        return {{{"status", "ok"}, {"message", "stopped"}, {"duration", duration}}, true};
    }
    return {{{"status", "processing"}, {"duration", duration}}, true};
}

Control::Reply Control::handle_toggle() {
    if (deps_.orchestrator.state() == SessionState::Recording) return handle_stop();
    return handle_start();
}

nlohmann::json Control::handle_cancel() {
    if (!deps_.orchestrator.cancel()) return error("nothing to cancel");
    return {{"status", "ok"}, {"message", "cancelled"}};
}

nlohmann::json Control::handle_wake(const nlohmann::json& cmd) {
    if (!deps_.wake_gate.enabled()) return error("wake word is disabled");

    float score = cmd.value("score", 1.0f);
    std::string model = cmd.value("model", std::string("wake"));
    auto now = WakeWordGate::Clock::now();

    if (!deps_.wake_gate.accept(score, now)) {
        log(std::format("wake '{}' score {:.2f} below threshold or in cooldown", model, score));
        return {{"status", "ok"}, {"accepted", false}};
    }
    if (!deps_.triggers.push(TriggerEvent::start(TriggerSource::WakeWord, now))) {
        return error("trigger queue full");
    }
    return {{"status", "ok"}, {"accepted", true}};
}

// --- History ---

nlohmann::json Control::handle_history(const nlohmann::json& cmd) {
    int limit = cmd.value("limit", 10);
    if (limit <= 0) limit = 10;

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : deps_.history.recent(limit)) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"session_id", e.session_id},
            {"trigger", e.trigger},
            {"outcome", e.outcome},
            {"text", e.final_text},
            {"raw_text", e.transcript},
            {"delivered_text", e.delivered_text},
            {"correction_failed", e.correction_failed},
            {"error", e.error},
            {"audio_duration", e.audio_duration_s},
            {"total_ms", e.total_ms},
        });
    }
    return resp;
}

nlohmann::json Control::handle_report(const nlohmann::json& cmd) {
    auto res = report::query(deps_.history, cmd.value("date", std::string("today")));
    if (!res) return error(res.error());
    return {{"status", "ok"}, {"report", *res}};
}

// --- Settings ---

nlohmann::json Control::settings_json(const Settings& s) {
    return {
        {"version", s.version},
        {"output_mode", to_string(s.output_mode)},
        {"correction_enabled", s.correction_enabled},
        {"vocabulary", s.vocabulary},
        {"corrections", s.corrections},
    };
}

nlohmann::json Control::handle_set_mode(const nlohmann::json& cmd) {
    auto mode = parse_output_mode(cmd.value("mode", std::string()));
    if (!mode) return error("mode must be raw, corrected or both");

    auto s = deps_.settings.update([&](Settings& st) { st.output_mode = *mode; });
    return {{"status", "ok"}, {"output_mode", to_string(s->output_mode)}, {"version", s->version}};
}

nlohmann::json Control::handle_set_correction(const nlohmann::json& cmd) {
    if (!cmd.contains("enabled") || !cmd["enabled"].is_boolean()) {
        return error("enabled must be true or false");
    }
    bool enabled = cmd["enabled"].get<bool>();
    auto s = deps_.settings.update([&](Settings& st) { st.correction_enabled = enabled; });
    return {{"status", "ok"}, {"correction_enabled", s->correction_enabled}, {"version", s->version}};
}

nlohmann::json Control::handle_teach(const nlohmann::json& cmd) {
    auto terms = text::split_terms(cmd.value("terms", std::string()));
    if (terms.empty()) return error("no terms given");

    size_t added = 0;
    auto s = deps_.settings.update([&](Settings& st) {
        added = text::merge_terms(st.vocabulary, terms);
    });
    return {{"status", "ok"}, {"added", added}, {"vocabulary_size", s->vocabulary.size()}};
}

nlohmann::json Control::handle_add_correction(const nlohmann::json& cmd) {
    auto wrong = text::trim(cmd.value("wrong", std::string()));
    auto right = text::trim(cmd.value("right", std::string()));
    if (wrong.empty() || right.empty()) return error("wrong and right are required");

    auto s = deps_.settings.update([&](Settings& st) { st.corrections[wrong] = right; });
    return {{"status", "ok"}, {"corrections_size", s->corrections.size()}};
}

// --- Speech ---

nlohmann::json Control::handle_speech(const std::string& name, const nlohmann::json& cmd) {
    if (!deps_.speech) return error("speech is not available");
    auto& speech = *deps_.speech;

    if (name == "speak") {
        SpeakRequest req{
            .text = cmd.value("text", std::string()),
            .summarize = cmd.value("summarize", true),
            .event_type = cmd.value("event_type", std::string("notification")),
            .start_reminder = cmd.value("start_reminder", false),
        };
        if (auto r = speech.speak(std::move(req)); !r) return error(r.error());
        return {{"status", "ok"}, {"message", "speaking"}};
    }
    if (name == "speech_cancel") {
        speech.interrupt();
        return {{"status", "ok"}, {"message", "cancelled"}};
    }
    if (name == "reminder_cancel") {
        return {{"status", "ok"}, {"reminders_fired", speech.cancel_reminder()}};
    }
    if (name == "set_voice") {
        auto voice = text::trim(cmd.value("voice", std::string()));
        if (voice.empty()) return error("voice is required");
        speech.set_voice(voice);
        return {{"status", "ok"}, {"voice", voice}};
    }
    if (name == "speech_enable" || name == "speech_disable") {
        speech.set_enabled(name == "speech_enable");
        return {{"status", "ok"}, {"enabled", speech.enabled()}};
    }
    if (name == "speech_status") return speech.status();
    return error("unknown command");
}

void Control::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[push-dictate] {}", msg);
    }
}
