#pragma once

#include <condition_variable>
#include <mutex>
#include <stop_token>

// Keeps speech out of the microphone: closed while a dictation is recording.
class VoiceGate {
public:
    void set_busy(bool busy) {
        {
            std::lock_guard lock(mu_);
            busy_ = busy;
        }
        cv_.notify_all();
    }

    bool busy() const {
        std::lock_guard lock(mu_);
        return busy_;
    }

    // Blocks while busy. Returns false when `stop` fired first.
    bool wait_idle(std::stop_token stop) {
        std::unique_lock lock(mu_);
        return cv_.wait(lock, stop, [this] { return !busy_; });
    }

private:
    mutable std::mutex mu_;
    std::condition_variable_any cv_;
    bool busy_ = false;
};
