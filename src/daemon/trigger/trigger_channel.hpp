#pragma once

#include "trigger/trigger_event.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

// Bounded multi-producer queue feeding the single-threaded event loop.
// Producers (keyboard thread, socket handler) never block: when the queue is
// full the event is dropped and counted. `wake` is invoked after each
// successful push (the Linux loop writes an eventfd there).
class TriggerChannel {
public:
    explicit TriggerChannel(size_t capacity = 16, std::function<void()> wake = {});

    bool push(const TriggerEvent& event);
    std::vector<TriggerEvent> drain();

    void set_wake(std::function<void()> wake);
    uint64_t dropped() const;

private:
    size_t capacity_;
    std::function<void()> wake_;
    mutable std::mutex mu_;
    std::deque<TriggerEvent> queue_;
    uint64_t dropped_ = 0;
};
