#include "session.hpp"

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Processing: return "processing";
    }
    return "idle";
}

std::string_view to_string(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::Completed: return "completed";
        case SessionOutcome::CorrectionFallback: return "correction_fallback";
        case SessionOutcome::NoSpeech: return "no_speech";
        case SessionOutcome::Failed: return "failed";
        case SessionOutcome::DeliveryFailed: return "delivery_failed";
        case SessionOutcome::Cancelled: return "cancelled";
        case SessionOutcome::Aborted: return "aborted";
    }
    return "failed";
}

std::string_view to_string(StopReason reason) {
    switch (reason) {
        case StopReason::None: return "none";
        case StopReason::Trigger: return "trigger";
        case StopReason::Silence: return "silence";
        case StopReason::MaxDuration: return "max_duration";
        case StopReason::Cancelled: return "cancelled";
        case StopReason::DeviceLost: return "device_lost";
    }
    return "none";
}

bool is_success(SessionOutcome outcome) {
    return outcome == SessionOutcome::Completed ||
           outcome == SessionOutcome::CorrectionFallback;
}
