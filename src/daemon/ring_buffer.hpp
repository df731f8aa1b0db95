#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer ring of f32 samples.
// Producer (PipeWire RT thread) calls write(). Consumer (event loop) calls read()/drain_all().
// write() never blocks or allocates; samples that do not fit are counted and dropped.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: returns samples actually written.
    size_t write(const float* data, size_t count) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t avail = capacity_ - (w - r);
        size_t to_write = std::min(count, avail);
        if (to_write < count) {
            dropped_.fetch_add(count - to_write, std::memory_order_relaxed);
        }
        if (to_write == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::memcpy(buf_.data() + offset, data, first * sizeof(float));
        if (first < to_write) {
            std::memcpy(buf_.data(), data + first, (to_write - first) * sizeof(float));
        }

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer: read up to max_count samples. Returns samples actually read.
    size_t read(float* dest, size_t max_count) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t to_read = std::min(max_count, w - r);
        if (to_read == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(to_read, capacity_ - offset);
        std::memcpy(dest, buf_.data() + offset, first * sizeof(float));
        if (first < to_read) {
            std::memcpy(dest + first, buf_.data(), (to_read - first) * sizeof(float));
        }

        read_pos_.store(r + to_read, std::memory_order_release);
        return to_read;
    }

    // Consumer: drain everything currently available.
    std::vector<float> drain_all() {
        std::vector<float> samples(available());
        if (samples.empty()) return samples;
        samples.resize(read(samples.data(), samples.size()));
        return samples;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }

    // Samples lost because the consumer fell behind. Resets the counter.
    uint64_t take_dropped() {
        return dropped_.exchange(0, std::memory_order_relaxed);
    }

    // Only safe while the producer is stopped.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<float> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    alignas(64) std::atomic<uint64_t> dropped_{0};
};
