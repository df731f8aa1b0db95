#include "whisper/lan_backend.hpp"

#include "pipeline/text_rules.hpp"
#include "wav_encoder.hpp"

#include <chrono>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

LanBackend::LanBackend(const HttpClient& http, std::string url, std::string api_format,
                       std::string language)
    : http_(http), url_(std::move(url)), api_format_(std::move(api_format)),
      language_(std::move(language)) {}

StageResult<TranscriptResult>
LanBackend::transcribe(std::span<const float> audio, uint32_t sample_rate,
                       const std::vector<std::string>& vocabulary, const StageContext& ctx) {
    if (audio.empty()) {
        return std::unexpected(StageError::failure("empty audio"));
    }

    double duration_s = static_cast<double>(audio.size()) / sample_rate;

    auto wav_data = wav::encode(audio, sample_rate);
    FormPart file{
        .name = "file",
        .data = std::string(reinterpret_cast<const char*>(wav_data.data()), wav_data.size()),
        .filename = "audio.wav",
        .content_type = "audio/wav",
    };

    std::string prompt;
    for (auto& term : vocabulary) {
        if (!prompt.empty()) prompt += ", ";
        prompt += term;
    }

    std::string endpoint;
    std::vector<FormPart> parts;
    parts.push_back(std::move(file));

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";
        parts.push_back({.name = "model", .data = "whisper-1"});
        parts.push_back({.name = "response_format", .data = "json"});
    } else {
        // whisper.cpp server format
        endpoint = url_ + "/inference";
        parts.push_back({.name = "temperature", .data = "0.0"});
        parts.push_back({.name = "response_format", .data = "json"});
    }
    if (!language_.empty()) {
        parts.push_back({.name = "language", .data = language_});
    }
    if (!prompt.empty()) {
        parts.push_back({.name = "prompt", .data = prompt});
    }

    auto start = std::chrono::steady_clock::now();
    auto resp = http_.post_form(endpoint, parts, ctx);
    double processing_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (!resp) return std::unexpected(resp.error());

    try {
        auto j = json::parse(resp->body);
        std::string transcript;

        if (j.contains("text")) {
            transcript = j["text"].get<std::string>();
        } else if (j.contains("error")) {
            return std::unexpected(StageError::failure("server error: " + j["error"].dump()));
        } else {
            return std::unexpected(StageError::failure("unexpected response: " + resp->body));
        }

        return TranscriptResult{
            .text = text::trim(transcript),
            .duration_s = duration_s,
            .processing_s = processing_s,
        };
    } catch (const json::exception& e) {
        return std::unexpected(StageError::failure(std::string("JSON parse error: ") + e.what()));
    }
}
