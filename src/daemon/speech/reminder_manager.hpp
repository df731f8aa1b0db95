#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

// Repeats a notification until cancelled. The first repeat comes after
// `interval`, each following one after the previous delay times `backoff`,
// and at most `max_reminders` fire.
class ReminderManager {
public:
    // n is 1-based. The callback runs on the reminder thread and must return
    // soon after `stop` fires; it must not call start() or cancel().
    using Callback = std::function<void(const std::string& text, uint32_t n, std::stop_token stop)>;

    ReminderManager(std::chrono::milliseconds interval, double backoff, uint32_t max_reminders);
    ~ReminderManager();

    ReminderManager(const ReminderManager&) = delete;
    ReminderManager& operator=(const ReminderManager&) = delete;

    // Replaces any running schedule.
    void start(std::string text, Callback callback);
    // Stops the schedule. Returns how many reminders had fired.
    uint32_t cancel();

    bool active() const { return active_.load(); }
    uint32_t fired() const { return fired_.load(); }

    std::chrono::milliseconds delay_for(uint32_t n) const;

private:
    void run(std::stop_token stop, std::string text, Callback callback);

    std::chrono::milliseconds interval_;
    double backoff_;
    uint32_t max_reminders_;

    std::mutex control_mu_;
    std::mutex wait_mu_;
    std::condition_variable_any cv_;
    std::atomic<bool> active_{false};
    std::atomic<uint32_t> fired_{0};
    std::jthread thread_;
};
