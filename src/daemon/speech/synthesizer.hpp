#pragma once

#include "pipeline/stage.hpp"

#include <stop_token>
#include <string>

// Text-to-speech engine. speak() blocks until playback ends and must return
// StageError::cancelled promptly once `stop` is requested.
class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;
    virtual StageResult<void> speak(const std::string& text, const std::string& voice,
                                    std::stop_token stop) = 0;
};
