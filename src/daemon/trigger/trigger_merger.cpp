#include "trigger/trigger_merger.hpp"

TriggerMerger::TriggerMerger(std::chrono::milliseconds debounce)
    : debounce_(debounce) {}

TriggerMerger::Decision TriggerMerger::resolve(const TriggerEvent& event, SessionState state,
                                               std::optional<TriggerSource> session_source) const {
    if (event.type == TriggerEvent::Type::Start) {
        return resolve_start(event, state);
    }
    return resolve_stop(event, state, session_source);
}

TriggerMerger::Decision TriggerMerger::resolve_start(const TriggerEvent& event, SessionState state) const {
    if (state != SessionState::Idle) return Decision::IgnoreBusy;

    if (last_accepted_start_ &&
        last_accepted_start_->source != event.source &&
        event.at >= last_accepted_start_->at &&
        event.at - last_accepted_start_->at < debounce_) {
        return Decision::IgnoreDuplicate;
    }
    return Decision::Accept;
}

void TriggerMerger::commit(const TriggerEvent& start) {
    if (start.type == TriggerEvent::Type::Start) last_accepted_start_ = start;
}

TriggerMerger::Decision TriggerMerger::resolve_stop(const TriggerEvent& event, SessionState state,
                                                    std::optional<TriggerSource> session_source) const {
    if (state != SessionState::Recording || !session_source) return Decision::IgnoreNotRecording;

    switch (event.source) {
        case TriggerSource::Chord:
            return *session_source == TriggerSource::Chord ? Decision::Accept
                                                           : Decision::IgnoreForeignStop;
        case TriggerSource::Silence:
            return *session_source == TriggerSource::WakeWord ? Decision::Accept
                                                              : Decision::IgnoreForeignStop;
        case TriggerSource::WakeWord:
            // The classifier only ever starts sessions.
            return Decision::IgnoreForeignStop;
        case TriggerSource::Control:
        case TriggerSource::MaxDuration:
            return Decision::Accept;
    }
    return Decision::IgnoreForeignStop;
}

std::string_view to_string(TriggerMerger::Decision decision) {
    switch (decision) {
        case TriggerMerger::Decision::Accept: return "accept";
        case TriggerMerger::Decision::IgnoreBusy: return "busy";
        case TriggerMerger::Decision::IgnoreDuplicate: return "duplicate start";
        case TriggerMerger::Decision::IgnoreNotRecording: return "not recording";
        case TriggerMerger::Decision::IgnoreForeignStop: return "stop from another source";
    }
    return "unknown";
}
