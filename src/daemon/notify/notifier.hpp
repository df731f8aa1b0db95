#pragma once

#include <cstdint>
#include <string>
#include <string_view>

enum class NotifyEvent { SessionStarted, SessionCompleted, SessionFailed };

struct NotifyPayload {
    uint64_t session_id = 0;
    std::string text;   // delivered text, or the failure reason
    std::string detail; // trigger kind, outcome name, ...
};

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(NotifyEvent event, const NotifyPayload& payload) = 0;
};

inline std::string_view to_string(NotifyEvent event) {
    switch (event) {
        case NotifyEvent::SessionStarted: return "session_started";
        case NotifyEvent::SessionCompleted: return "session_completed";
        case NotifyEvent::SessionFailed: return "session_failed";
    }
    return "session_failed";
}
