#pragma once

#include "speech/synthesizer.hpp"

#include <string>
#include <vector>

// Speaks through an external TTS command. "{voice}" in any argument is
// replaced by the voice name; the text goes to stdin.
class CommandSynthesizer : public SpeechSynthesizer {
public:
    explicit CommandSynthesizer(std::vector<std::string> command);

    StageResult<void> speak(const std::string& text, const std::string& voice,
                            std::stop_token stop) override;

    std::vector<std::string> build_argv(const std::string& voice) const;

private:
    std::vector<std::string> command_;
};
