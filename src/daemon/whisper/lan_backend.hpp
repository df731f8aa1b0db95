#pragma once

#include "net/http_client.hpp"
#include "whisper/backend.hpp"

#include <string>

// Talks to a whisper server on the local network.
class LanBackend : public WhisperBackend {
public:
    // api_format: "whisper.cpp" (POST /inference) or "openai" (POST /v1/audio/transcriptions)
    LanBackend(const HttpClient& http, std::string url, std::string api_format = "whisper.cpp",
               std::string language = "en");

    StageResult<TranscriptResult>
        transcribe(std::span<const float> audio, uint32_t sample_rate,
                   const std::vector<std::string>& vocabulary, const StageContext& ctx) override;

private:
    const HttpClient& http_;
    std::string url_;
    std::string api_format_;
    std::string language_;
};
