#pragma once

#include "settings.hpp"
#include "trigger/trigger_event.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

enum class SessionState { Idle, Recording, Processing };

enum class SessionOutcome {
    Completed,
    CorrectionFallback, // delivered, but the corrector failed and raw text was used
    NoSpeech,           // too short, silent, or only a known hallucination
    Failed,             // transcription failed
    DeliveryFailed,     // every output backend failed
    Cancelled,
    Aborted,            // input device lost
};

enum class StopReason { None, Trigger, Silence, MaxDuration, Cancelled, DeviceLost };

struct StageLatencies {
    double transcribe_ms = 0.0;
    double correct_ms = 0.0;
    double deliver_ms = 0.0;
    double total_ms = 0.0;
};

// One dictation attempt, owned by the orchestrator from Start to archive.
struct Session {
    using Clock = std::chrono::steady_clock;

    uint64_t id = 0;
    TriggerKind trigger_kind = TriggerKind::Manual;
    TriggerSource trigger_source = TriggerSource::Control;
    Clock::time_point start_time{};
    Clock::time_point end_time{};
    std::chrono::system_clock::time_point wall_start{};

    std::shared_ptr<const std::vector<float>> audio;
    double audio_duration_s = 0.0;

    std::string transcript;     // as returned by the transcriber
    std::string raw_text;       // transcript after dictionary replacements
    std::string corrected_text;
    std::string final_text;
    std::string delivered_text;

    std::shared_ptr<const Settings> settings;
    OutputMode output_mode = OutputMode::CorrectedOnly;

    StageLatencies latencies;
    StopReason stop_reason = StopReason::None;
    bool correction_ran = false;
    bool correction_failed = false;
    std::string error;
    std::string delivery_backend;
};

std::string_view to_string(SessionState state);
std::string_view to_string(SessionOutcome outcome);
std::string_view to_string(StopReason reason);

// Completed and CorrectionFallback count as success for notifications.
bool is_success(SessionOutcome outcome);
