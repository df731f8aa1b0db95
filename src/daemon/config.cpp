#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr uint32_t kMinRingMs = 100;

template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    if (obj.contains(key)) out = obj[key].get<T>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);
        Config parsed;

        if (j.contains("backend")) {
            auto& b = j["backend"];
            read_key(b, "type", parsed.backend.type);
            read_key(b, "url", parsed.backend.url);
            read_key(b, "api_format", parsed.backend.api_format);
            read_key(b, "language", parsed.backend.language);
            read_key(b, "timeout_ms", parsed.backend.timeout_ms);
        }

        if (j.contains("correction")) {
            auto& c = j["correction"];
            read_key(c, "enabled", parsed.correction.enabled);
            read_key(c, "host", parsed.correction.host);
            read_key(c, "model", parsed.correction.model);
            read_key(c, "timeout_ms", parsed.correction.timeout_ms);
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            read_key(o, "mode", parsed.output.mode);
            read_key(o, "backends", parsed.output.backends);
            read_key(o, "terminal_paste", parsed.output.terminal_paste);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_key(a, "sample_rate", parsed.audio.sample_rate);
            read_key(a, "max_seconds", parsed.audio.max_seconds);
            read_key(a, "preroll_ms", parsed.audio.preroll_ms);
            read_key(a, "ring_ms", parsed.audio.ring_ms);
        }

        if (j.contains("hotkey")) {
            auto& h = j["hotkey"];
            read_key(h, "enabled", parsed.hotkey.enabled);
            read_key(h, "combos", parsed.hotkey.combos);
        }

        if (j.contains("silence")) {
            auto& s = j["silence"];
            read_key(s, "threshold", parsed.silence.threshold);
            read_key(s, "duration", parsed.silence.duration);
            read_key(s, "max_recording_duration", parsed.silence.max_recording_duration);
            read_key(s, "min_audio_seconds", parsed.silence.min_audio_seconds);
        }

        if (j.contains("wakeword")) {
            auto& w = j["wakeword"];
            read_key(w, "enabled", parsed.wakeword.enabled);
            read_key(w, "threshold", parsed.wakeword.threshold);
            read_key(w, "cooldown_ms", parsed.wakeword.cooldown_ms);
            read_key(w, "debounce_ms", parsed.wakeword.debounce_ms);
        }

        if (j.contains("device")) {
            auto& d = j["device"];
            read_key(d, "retry_base_ms", parsed.device.retry_base_ms);
            read_key(d, "retry_max_ms", parsed.device.retry_max_ms);
            read_key(d, "max_retries", parsed.device.max_retries);
        }

        if (j.contains("feedback")) {
            read_key(j["feedback"], "notifications", parsed.feedback.notifications);
        }

        if (j.contains("speech")) {
            auto& s = j["speech"];
            read_key(s, "enabled", parsed.speech.enabled);
            read_key(s, "command", parsed.speech.command);
            read_key(s, "voice", parsed.speech.voice);
            read_key(s, "max_direct_chars", parsed.speech.max_direct_chars);
            read_key(s, "summarize_model", parsed.speech.summarize_model);
            read_key(s, "summarize_timeout_ms", parsed.speech.summarize_timeout_ms);
            read_key(s, "reminder_interval_s", parsed.speech.reminder_interval_s);
            read_key(s, "reminder_backoff", parsed.speech.reminder_backoff);
            read_key(s, "max_reminders", parsed.speech.max_reminders);
        }

        read_key(j, "workers", parsed.workers);
        read_key(j, "vocabulary", parsed.vocabulary);
        read_key(j, "corrections", parsed.corrections);

        if (parsed.workers == 0) parsed.workers = 1;
        // A zero-sized ring buffer cannot be indexed.
        if (parsed.audio.sample_rate == 0) parsed.audio.sample_rate = Config::Audio{}.sample_rate;
        parsed.audio.ring_ms = std::max(parsed.audio.ring_ms, kMinRingMs);
        cfg = std::move(parsed);

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
