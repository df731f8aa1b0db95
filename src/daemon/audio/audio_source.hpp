#pragma once

#include "audio/preroll_buffer.hpp"
#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

struct CaptureHandle {
    uint64_t id = 0;
    explicit operator bool() const { return id != 0; }
};

// Owns the consumer side of the capture ring. pump() runs on the event loop
// thread: it moves fresh samples into the pre-roll window and, while a capture
// is open, into the capture buffer together with 10 ms RMS levels.
class AudioSource {
public:
    AudioSource(RingBuffer& ring, AudioCapture& capture, uint32_t sample_rate,
                size_t preroll_samples, size_t max_capture_samples);

    AudioSource(const AudioSource&) = delete;
    AudioSource& operator=(const AudioSource&) = delete;

    bool start();
    void stop();
    // Tears the stream down and opens it again; pre-roll is discarded.
    bool restart();
    bool healthy() const;

    // Returns the number of samples consumed from the ring.
    size_t pump();

    // Opens a capture seeded with the current pre-roll. Only one capture can
    // be open; a second call returns an empty handle.
    CaptureHandle begin_capture();
    // Closes the capture and hands its buffer to the caller. A stale or empty
    // handle yields no samples.
    std::vector<float> end_capture(CaptureHandle handle);

    bool capturing() const { return open_id_ != 0; }
    // Seconds captured since begin_capture(), pre-roll excluded.
    double captured_seconds() const;
    // Trailing `frames` per-frame levels of the open capture (fewer if the
    // capture is younger).
    std::span<const float> recent_levels(size_t frames) const;
    double frame_seconds() const;
    float input_level() const { return capture_.level(); }
    uint32_t sample_rate() const { return sample_rate_; }

private:
    void append_to_capture(std::span<const float> samples);

    RingBuffer& ring_;
    AudioCapture& capture_;
    uint32_t sample_rate_;
    size_t max_capture_samples_;
    size_t frame_samples_;

    PrerollBuffer preroll_;
    std::vector<float> scratch_;

    uint64_t next_id_ = 1;
    uint64_t open_id_ = 0;
    std::vector<float> capture_buf_;
    size_t seed_samples_ = 0;
    std::vector<float> levels_;
    double frame_sum_ = 0.0;
    size_t frame_count_ = 0;
    bool overflow_logged_ = false;
};
