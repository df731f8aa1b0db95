#pragma once

#include "session.hpp"
#include "trigger/trigger_event.hpp"

#include <chrono>
#include <optional>
#include <string_view>

// Resolves the merged trigger stream against the current session state.
//  - Idle: the first Start wins. A Start from a different producer within the
//    debounce window of a committed Start is a duplicate of the same utterance.
//  - Not idle: every Start is ignored, never queued.
//  - Stop: a chord release only ends a chord-started session; wake-word
//    sessions end by silence, explicit control, or the duration ceiling.
class TriggerMerger {
public:
    enum class Decision {
        Accept,
        IgnoreBusy,
        IgnoreDuplicate,
        IgnoreNotRecording,
        IgnoreForeignStop,
    };

    explicit TriggerMerger(std::chrono::milliseconds debounce);

    Decision resolve(const TriggerEvent& event, SessionState state,
                     std::optional<TriggerSource> session_source) const;

    // Records a Start that actually opened a session. Accepted Starts the
    // caller could not act on are never committed and do not debounce.
    void commit(const TriggerEvent& start);

private:
    Decision resolve_start(const TriggerEvent& event, SessionState state) const;
    Decision resolve_stop(const TriggerEvent& event, SessionState state,
                          std::optional<TriggerSource> session_source) const;

    std::chrono::milliseconds debounce_;
    std::optional<TriggerEvent> last_accepted_start_;
};

std::string_view to_string(TriggerMerger::Decision decision);
