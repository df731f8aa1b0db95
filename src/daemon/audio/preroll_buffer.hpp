#pragma once

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

// Fixed-capacity circular store of the most recent samples. Oldest samples are
// overwritten; copy_to() appends the contents in chronological order.
class PrerollBuffer {
public:
    explicit PrerollBuffer(size_t capacity) : buf_(capacity) {}

    void push(std::span<const float> samples) {
        if (buf_.empty()) return;
        if (samples.size() >= buf_.size()) {
            samples = samples.last(buf_.size());
        }
        for (float s : samples) {
            buf_[head_] = s;
            head_ = (head_ + 1) % buf_.size();
        }
        size_ = std::min(size_ + samples.size(), buf_.size());
    }

    void copy_to(std::vector<float>& out) const {
        if (size_ == 0) return;
        size_t start = (head_ + buf_.size() - size_) % buf_.size();
        size_t first = std::min(size_, buf_.size() - start);
        out.insert(out.end(), buf_.begin() + start, buf_.begin() + start + first);
        out.insert(out.end(), buf_.begin(), buf_.begin() + (size_ - first));
    }

    size_t size() const { return size_; }
    size_t capacity() const { return buf_.size(); }

    void clear() {
        head_ = 0;
        size_ = 0;
    }

private:
    std::vector<float> buf_;
    size_t head_ = 0;
    size_t size_ = 0;
};
