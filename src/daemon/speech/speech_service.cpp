#include "speech/speech_service.hpp"

#include "pipeline/text_rules.hpp"

#include <chrono>
#include <format>
#include <print>

namespace {

double ms_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

SpeechService::SpeechService(const Config::Speech& config, SpeechSynthesizer& synth,
                             Summarizer& summarizer, HistoryStore& history, VoiceGate& gate,
                             bool verbose)
    : config_(config), synth_(synth), summarizer_(summarizer), history_(history),
      gate_(gate), verbose_(verbose), voice_(config.voice), enabled_(config.enabled),
      reminders_(std::chrono::seconds(config.reminder_interval_s), config.reminder_backoff,
                 config.max_reminders) {}

SpeechService::~SpeechService() {
    shutdown();
}

std::expected<void, std::string> SpeechService::speak(SpeakRequest request) {
    if (!enabled_) return std::unexpected("speech is disabled");
    request.text = text::trim(request.text);
    if (request.text.empty()) return std::unexpected("nothing to say");

    reminders_.cancel();

    std::stop_token token;
    {
        std::lock_guard lock(mu_);
        current_.request_stop();
        current_ = std::stop_source{};
        token = current_.get_token();
    }

    worker_.submit([this, request = std::move(request), token] { run(request, token); });
    return {};
}

void SpeechService::interrupt() {
    std::lock_guard lock(mu_);
    current_.request_stop();
    reminder_utterance_.request_stop();
}

uint32_t SpeechService::cancel_reminder() {
    uint32_t fired = reminders_.cancel();
    log(std::format("reminder cancelled after {} repeat(s)", fired));
    return fired;
}

void SpeechService::set_voice(std::string voice) {
    std::lock_guard lock(mu_);
    voice_ = std::move(voice);
}

std::string SpeechService::voice() const {
    std::lock_guard lock(mu_);
    return voice_;
}

void SpeechService::set_enabled(bool enabled) {
    enabled_ = enabled;
    if (!enabled) {
        interrupt();
        reminders_.cancel();
    }
}

nlohmann::json SpeechService::status() const {
    return {
        {"status", "ok"},
        {"enabled", enabled()},
        {"voice", voice()},
        {"speaking", speaking()},
        {"reminder_active", reminders_.active()},
        {"reminders_fired", reminders_.fired()},
    };
}

void SpeechService::shutdown() {
    interrupt();
    reminders_.cancel();
    worker_.shutdown();
}

StageResult<void> SpeechService::say(const std::string& text, std::stop_token stop,
                                     double& synth_ms) {
    if (!gate_.wait_idle(stop)) return std::unexpected(StageError::cancelled());

    auto start = std::chrono::steady_clock::now();
    speaking_ = true;
    auto res = synth_.speak(text, voice(), stop);
    speaking_ = false;
    synth_ms = ms_since(start);
    return res;
}

void SpeechService::run(const SpeakRequest& request, std::stop_token stop) {
    if (stop.stop_requested()) return;

    auto start = std::chrono::steady_clock::now();
    SpeechRecord record{
        .event_type = request.event_type,
        .input_chars = static_cast<int64_t>(request.text.size()),
        .voice = voice(),
    };

    std::string spoken = request.text;
    if (request.summarize && spoken.size() > config_.max_direct_chars) {
        auto summary = summarizer_.summarize(spoken, stop);
        spoken = std::move(summary.text);
        record.summarized = summary.summarized;
        record.summarize_ms = summary.latency_ms;
        log(std::format("summarized {} -> {} chars", request.text.size(), spoken.size()));
    }

    auto res = say(spoken, stop, record.synth_ms);
    if (!res) {
        if (res.error().kind == StageError::Kind::Cancelled) {
            record.cancelled = true;
            log("speech interrupted");
        } else {
            std::println(stderr, "speech: {}", res.error().message);
        }
    }

    record.spoken_text = spoken;
    record.total_ms = ms_since(start);
    if (!history_.append_speech(record)) {
        std::println(stderr, "speech: failed to archive event");
    }

    if (res && request.start_reminder && !stop.stop_requested()) {
        reminders_.start(spoken, [this](const std::string& text, uint32_t n, std::stop_token st) {
            remind(text, n, st);
        });
    }
}

void SpeechService::remind(const std::string& text, uint32_t n, std::stop_token stop) {
    log(std::format("reminder #{}", n));

    SpeechRecord record{
        .event_type = "reminder",
        .input_chars = static_cast<int64_t>(text.size()),
        .spoken_text = text,
        .voice = voice(),
        .reminder_count = n,
    };
    // One utterance, stopped by interrupt() or by the schedule being cancelled.
    std::stop_source utterance;
    {
        std::lock_guard lock(mu_);
        reminder_utterance_ = utterance;
    }
    std::stop_callback link(stop, [&utterance] { utterance.request_stop(); });

    auto start = std::chrono::steady_clock::now();
    auto res = say(text, utterance.get_token(), record.synth_ms);
    {
        std::lock_guard lock(mu_);
        reminder_utterance_ = std::stop_source{std::nostopstate};
    }
    if (!res) {
        record.cancelled = true;
        if (res.error().kind != StageError::Kind::Cancelled) {
            std::println(stderr, "speech: reminder failed: {}", res.error().message);
        }
    }
    record.total_ms = ms_since(start);
    if (!history_.append_speech(record)) {
        std::println(stderr, "speech: failed to archive reminder");
    }
}

void SpeechService::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[push-dictate] {}", msg);
    }
}
