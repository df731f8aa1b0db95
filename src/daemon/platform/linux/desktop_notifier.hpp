#pragma once

#include "notify/notifier.hpp"

// notify-send popups. Failures are logged, never raised.
class DesktopNotifier : public Notifier {
public:
    explicit DesktopNotifier(bool verbose = false);
    void notify(NotifyEvent event, const NotifyPayload& payload) override;

private:
    bool verbose_;
};
