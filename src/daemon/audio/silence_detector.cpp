#include "audio/silence_detector.hpp"

#include <algorithm>
#include <cmath>

namespace silence {

namespace {
// Absorbs float error when frame counts are converted back to seconds.
constexpr double kDurationEpsilon = 1e-9;
}

float rms(std::span<const float> samples) {
    if (samples.empty()) return 0.0f;
    double sum = 0.0;
    for (float s : samples) {
        sum += static_cast<double>(s) * s;
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(samples.size())));
}

bool is_silent(std::span<const float> levels, double frame_seconds,
               float threshold, double min_duration) {
    if (levels.empty() || frame_seconds <= 0.0) return false;

    double covered = static_cast<double>(levels.size()) * frame_seconds;
    if (covered + kDurationEpsilon < min_duration) return false;

    return std::ranges::all_of(levels, [threshold](float level) { return level < threshold; });
}

size_t window_frames(double frame_seconds, double min_duration) {
    if (frame_seconds <= 0.0 || min_duration <= 0.0) return 1;
    return static_cast<size_t>(std::ceil(min_duration / frame_seconds - kDurationEpsilon));
}

} // namespace silence
