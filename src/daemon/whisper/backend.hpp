#pragma once

#include "pipeline/stage.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

struct TranscriptResult {
    std::string text;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

// Speech-to-text engine. `vocabulary` biases recognition toward known terms.
class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;
    virtual StageResult<TranscriptResult>
        transcribe(std::span<const float> audio, uint32_t sample_rate,
                   const std::vector<std::string>& vocabulary, const StageContext& ctx) = 0;
};
