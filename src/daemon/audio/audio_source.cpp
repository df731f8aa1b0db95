#include "audio/audio_source.hpp"

#include <algorithm>
#include <cmath>
#include <print>

AudioSource::AudioSource(RingBuffer& ring, AudioCapture& capture, uint32_t sample_rate,
                         size_t preroll_samples, size_t max_capture_samples)
    : ring_(ring), capture_(capture), sample_rate_(sample_rate),
      max_capture_samples_(max_capture_samples),
      frame_samples_(std::max<size_t>(1, sample_rate / 100)),
      preroll_(preroll_samples),
      scratch_(std::max<size_t>(ring.capacity(), 1)) {}

bool AudioSource::start() {
    ring_.reset();
    preroll_.clear();
    return capture_.start();
}

void AudioSource::stop() {
    capture_.stop();
}

bool AudioSource::restart() {
    capture_.stop();
    return start();
}

bool AudioSource::healthy() const {
    return capture_.is_capturing() && !capture_.failed();
}

size_t AudioSource::pump() {
    size_t total = 0;
    while (true) {
        size_t n = ring_.read(scratch_.data(), scratch_.size());
        if (n == 0) break;
        std::span<const float> chunk(scratch_.data(), n);
        preroll_.push(chunk);
        if (open_id_ != 0) append_to_capture(chunk);
        total += n;
    }

    if (auto dropped = ring_.take_dropped(); dropped > 0) {
        std::println(stderr, "audio: event loop fell behind, {} samples dropped", dropped);
    }
    return total;
}

CaptureHandle AudioSource::begin_capture() {
    if (open_id_ != 0) return {};

    pump();

    capture_buf_.clear();
    capture_buf_.reserve(max_capture_samples_ + preroll_.capacity());
    preroll_.copy_to(capture_buf_);
    seed_samples_ = capture_buf_.size();
    levels_.clear();
    frame_sum_ = 0.0;
    frame_count_ = 0;
    overflow_logged_ = false;

    open_id_ = next_id_++;
    return CaptureHandle{open_id_};
}

std::vector<float> AudioSource::end_capture(CaptureHandle handle) {
    if (!handle || handle.id != open_id_) return {};

    pump();
    open_id_ = 0;

    std::vector<float> out;
    out.swap(capture_buf_);
    levels_.clear();
    return out;
}

double AudioSource::captured_seconds() const {
    if (open_id_ == 0) return 0.0;
    return static_cast<double>(capture_buf_.size() - seed_samples_) / sample_rate_;
}

std::span<const float> AudioSource::recent_levels(size_t frames) const {
    std::span<const float> all(levels_);
    return all.last(std::min(frames, all.size()));
}

double AudioSource::frame_seconds() const {
    return static_cast<double>(frame_samples_) / sample_rate_;
}

void AudioSource::append_to_capture(std::span<const float> samples) {
    size_t limit = max_capture_samples_ + seed_samples_;
    size_t room = capture_buf_.size() < limit ? limit - capture_buf_.size() : 0;
    if (samples.size() > room) {
        if (!overflow_logged_) {
            std::println(stderr, "audio: capture buffer full, dropping samples");
            overflow_logged_ = true;
        }
        samples = samples.first(room);
    }

    capture_buf_.insert(capture_buf_.end(), samples.begin(), samples.end());

    for (float s : samples) {
        frame_sum_ += static_cast<double>(s) * s;
        if (++frame_count_ == frame_samples_) {
            levels_.push_back(static_cast<float>(std::sqrt(frame_sum_ / frame_count_)));
            frame_sum_ = 0.0;
            frame_count_ = 0;
        }
    }
}
