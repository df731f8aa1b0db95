#include "trigger/trigger_channel.hpp"

#include <print>

TriggerChannel::TriggerChannel(size_t capacity, std::function<void()> wake)
    : capacity_(capacity), wake_(std::move(wake)) {}

bool TriggerChannel::push(const TriggerEvent& event) {
    std::function<void()> wake;
    {
        std::lock_guard lock(mu_);
        if (queue_.size() >= capacity_) {
            ++dropped_;
            std::println(stderr, "trigger: channel full, dropping {} event from {}",
                         event.type == TriggerEvent::Type::Start ? "start" : "stop",
                         to_string(event.source));
            return false;
        }
        queue_.push_back(event);
        wake = wake_;
    }
    if (wake) wake();
    return true;
}

std::vector<TriggerEvent> TriggerChannel::drain() {
    std::lock_guard lock(mu_);
    std::vector<TriggerEvent> out(queue_.begin(), queue_.end());
    queue_.clear();
    return out;
}

void TriggerChannel::set_wake(std::function<void()> wake) {
    std::lock_guard lock(mu_);
    wake_ = std::move(wake);
}

uint64_t TriggerChannel::dropped() const {
    std::lock_guard lock(mu_);
    return dropped_;
}
