#include "trigger/wake_word_gate.hpp"

WakeWordGate::WakeWordGate(bool enabled, float threshold, std::chrono::milliseconds cooldown)
    : enabled_(enabled), threshold_(threshold), cooldown_(cooldown) {}

bool WakeWordGate::accept(float score, Clock::time_point now) {
    if (!enabled_ || score < threshold_) return false;
    if (last_fire_ && now - *last_fire_ < cooldown_) return false;
    last_fire_ = now;
    return true;
}
