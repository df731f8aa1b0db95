#pragma once

#include <chrono>
#include <optional>

// Turns raw classifier scores into at most one Start per cooldown period.
class WakeWordGate {
public:
    using Clock = std::chrono::steady_clock;

    WakeWordGate(bool enabled, float threshold, std::chrono::milliseconds cooldown);

    // True when the detection should become a Start trigger.
    bool accept(float score, Clock::time_point now);

    bool enabled() const { return enabled_; }
    float threshold() const { return threshold_; }

private:
    bool enabled_;
    float threshold_;
    std::chrono::milliseconds cooldown_;
    std::optional<Clock::time_point> last_fire_;
};
