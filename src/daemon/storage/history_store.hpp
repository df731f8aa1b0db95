#pragma once

#include <cstdint>
#include <string>
#include <vector>

// One row per finished dictation session. Written once, never updated.
struct HistoryRecord {
    int64_t id = 0;
    std::string timestamp; // local ISO-8601; filled in by the store when empty
    uint64_t session_id = 0;
    std::string trigger;
    std::string outcome;
    std::string stop_reason;
    std::string output_mode;
    std::string transcript;
    std::string corrected_text;
    std::string final_text;
    std::string delivered_text;
    bool correction_failed = false;
    std::string error;
    std::string delivery_backend;
    double transcribe_ms = 0.0;
    double correct_ms = 0.0;
    double deliver_ms = 0.0;
    double total_ms = 0.0;
    double audio_duration_s = 0.0;
    int64_t char_count = 0;
    int64_t word_count = 0;
    double speed_ratio = 0.0; // audio seconds per second of processing
};

// One row per spoken notification.
struct SpeechRecord {
    int64_t id = 0;
    std::string timestamp;
    std::string event_type;
    int64_t input_chars = 0;
    bool summarized = false;
    std::string spoken_text;
    double summarize_ms = 0.0;
    double synth_ms = 0.0;
    double total_ms = 0.0;
    std::string voice;
    bool cancelled = false;
    int64_t reminder_count = 0;
};

class HistoryStore {
public:
    virtual ~HistoryStore() = default;
    virtual bool append(const HistoryRecord& record) = 0;
    virtual bool append_speech(const SpeechRecord& record) = 0;
    virtual std::vector<HistoryRecord> recent(int limit) = 0;
    // date: "YYYY-MM-DD" in local time.
    virtual std::vector<HistoryRecord> on_date(const std::string& date) = 0;
    virtual std::vector<SpeechRecord> speech_on_date(const std::string& date) = 0;
    // Days with any activity, newest first.
    virtual std::vector<std::string> dates() = 0;
};
