#pragma once

#include <chrono>
#include <string_view>

// Who produced a trigger. Chord and WakeWord are the two external producers;
// Control is the socket API; Silence and MaxDuration are synthesized by the
// orchestrator itself.
enum class TriggerSource { Chord, WakeWord, Control, Silence, MaxDuration };

enum class TriggerKind { Manual, WakeWord };

struct TriggerEvent {
    enum class Type { Start, Stop };

    Type type = Type::Start;
    TriggerSource source = TriggerSource::Control;
    std::chrono::steady_clock::time_point at{};

    static TriggerEvent start(TriggerSource source,
                              std::chrono::steady_clock::time_point at = std::chrono::steady_clock::now()) {
        return {Type::Start, source, at};
    }
    static TriggerEvent stop(TriggerSource source,
                             std::chrono::steady_clock::time_point at = std::chrono::steady_clock::now()) {
        return {Type::Stop, source, at};
    }

    TriggerKind kind() const {
        return source == TriggerSource::WakeWord ? TriggerKind::WakeWord : TriggerKind::Manual;
    }
};

inline std::string_view to_string(TriggerSource source) {
    switch (source) {
        case TriggerSource::Chord: return "chord";
        case TriggerSource::WakeWord: return "wake_word";
        case TriggerSource::Control: return "control";
        case TriggerSource::Silence: return "silence";
        case TriggerSource::MaxDuration: return "max_duration";
    }
    return "control";
}

inline std::string_view to_string(TriggerKind kind) {
    return kind == TriggerKind::WakeWord ? "wake_word" : "manual";
}
