#pragma once

#include <cstddef>
#include <span>

namespace silence {

// Root mean square of a block of f32 samples; 0 for an empty block.
float rms(std::span<const float> samples);

// True when `levels` (consecutive per-frame RMS values, oldest first, each
// covering `frame_seconds`) span at least `min_duration` seconds and every
// level is below `threshold`.
bool is_silent(std::span<const float> levels, double frame_seconds,
               float threshold, double min_duration);

// Number of trailing frames to evaluate for a given minimum duration.
size_t window_frames(double frame_seconds, double min_duration);

} // namespace silence
