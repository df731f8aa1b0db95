#pragma once

#include "config.hpp"
#include "speech/reminder_manager.hpp"
#include "speech/summarizer.hpp"
#include "speech/synthesizer.hpp"
#include "speech/voice_gate.hpp"
#include "storage/history_store.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stop_token>
#include <string>

struct SpeakRequest {
    std::string text;
    bool summarize = true;
    std::string event_type = "notification";
    bool start_reminder = false;
};

// Spoken notifications. Requests run one at a time on a private worker; a new
// request interrupts the one in flight and replaces any reminder schedule.
class SpeechService {
public:
    SpeechService(const Config::Speech& config, SpeechSynthesizer& synth,
                  Summarizer& summarizer, HistoryStore& history, VoiceGate& gate,
                  bool verbose = false);
    ~SpeechService();

    SpeechService(const SpeechService&) = delete;
    SpeechService& operator=(const SpeechService&) = delete;

    std::expected<void, std::string> speak(SpeakRequest request);
    // Interrupts in-flight speech, a reminder being spoken included.
    // Reminders keep their schedule.
    void interrupt();
    // Returns the number of reminders that had fired.
    uint32_t cancel_reminder();

    void set_voice(std::string voice);
    std::string voice() const;
    void set_enabled(bool enabled);
    bool enabled() const { return enabled_.load(); }
    bool speaking() const { return speaking_.load(); }

    nlohmann::json status() const;

    // Stops speech and reminders and joins the worker.
    void shutdown();

private:
    void run(const SpeakRequest& request, std::stop_token stop);
    void remind(const std::string& text, uint32_t n, std::stop_token stop);
    StageResult<void> say(const std::string& text, std::stop_token stop, double& synth_ms);

    void log(const std::string& msg);

    Config::Speech config_;
    SpeechSynthesizer& synth_;
    Summarizer& summarizer_;
    HistoryStore& history_;
    VoiceGate& gate_;
    bool verbose_;

    mutable std::mutex mu_;
    std::string voice_;
    std::stop_source current_;
    std::stop_source reminder_utterance_{std::nostopstate};
    std::atomic<bool> enabled_;
    std::atomic<bool> speaking_{false};

    ReminderManager reminders_;
    WorkerPool worker_{1};
};
