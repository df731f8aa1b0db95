#include "speech/reminder_manager.hpp"

#include <cmath>

ReminderManager::ReminderManager(std::chrono::milliseconds interval, double backoff,
                                 uint32_t max_reminders)
    : interval_(interval), backoff_(backoff < 1.0 ? 1.0 : backoff),
      max_reminders_(max_reminders) {}

ReminderManager::~ReminderManager() {
    cancel();
}

std::chrono::milliseconds ReminderManager::delay_for(uint32_t n) const {
    double ms = static_cast<double>(interval_.count()) * std::pow(backoff_, n);
    return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

void ReminderManager::start(std::string text, Callback callback) {
    std::lock_guard lock(control_mu_);
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    fired_ = 0;
    if (max_reminders_ == 0) return;

    active_ = true;
    thread_ = std::jthread([this, text = std::move(text), callback = std::move(callback)]
                           (std::stop_token st) mutable {
        run(st, std::move(text), std::move(callback));
    });
}

uint32_t ReminderManager::cancel() {
    std::lock_guard lock(control_mu_);
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    active_ = false;
    return fired_.exchange(0);
}

void ReminderManager::run(std::stop_token stop, std::string text, Callback callback) {
    for (uint32_t n = 0; n < max_reminders_; ++n) {
        {
            std::unique_lock lock(wait_mu_);
            cv_.wait_for(lock, stop, delay_for(n), [] { return false; });
        }
        if (stop.stop_requested()) break;

        ++fired_;
        callback(text, n + 1, stop);
    }
    active_ = false;
}
