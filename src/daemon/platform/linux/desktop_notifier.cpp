#include "platform/linux/desktop_notifier.hpp"

#include "platform/subprocess.hpp"

#include <print>

namespace {

constexpr size_t kMaxBody = 200;

std::string clip(const std::string& s) {
    if (s.size() <= kMaxBody) return s;
    return s.substr(0, kMaxBody) + "...";
}

} // namespace

DesktopNotifier::DesktopNotifier(bool verbose)
    : verbose_(verbose) {}

void DesktopNotifier::notify(NotifyEvent event, const NotifyPayload& payload) {
    std::string summary;
    std::string body;
    std::string urgency = "low";
    std::string timeout = "2000";

    switch (event) {
        case NotifyEvent::SessionStarted:
            summary = "Listening...";
            body = payload.detail == "wake_word" ? "Wake word detected" : "Recording";
            timeout = "1500";
            break;
        case NotifyEvent::SessionCompleted:
            summary = "Dictation";
            body = clip(payload.text);
            break;
        case NotifyEvent::SessionFailed:
            summary = "Dictation " + payload.detail;
            body = clip(payload.text);
            urgency = "normal";
            timeout = "4000";
            break;
    }

    auto res = platform::run_checked({"notify-send", "-a", "push-dictate", "-u", urgency,
                                      "-t", timeout, summary, body});
    if (!res) {
        std::println(stderr, "notify: {}", res.error());
    } else if (verbose_) {
        std::println(stderr, "[push-dictate] notified {}", to_string(event));
    }
}
