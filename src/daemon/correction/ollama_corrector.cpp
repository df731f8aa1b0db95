#include "correction/ollama_corrector.hpp"

#include <chrono>

namespace {

constexpr const char* kPromptHead =
    "Fix this speech transcription. Correct:\n"
    "- Grammar and punctuation\n"
    "- Misspelled names\n"
    "- Technical terms\n"
    "- Every sentence must end with a full stop or question mark\n"
    "\n"
    "Output ONLY the corrected text, nothing else.\n";

} // namespace

OllamaCorrector::OllamaCorrector(const OllamaClient& client, std::string model)
    : client_(client), model_(std::move(model)) {}

std::string OllamaCorrector::build_prompt(const std::string& text,
                                          const std::map<std::string, std::string>& dictionary) {
    std::string prompt = kPromptHead;
    if (!dictionary.empty()) {
        prompt += "\nKnown corrections (apply these substitutions):\n";
        for (auto& [wrong, right] : dictionary) {
            prompt += "- \"" + wrong + "\" → \"" + right + "\"\n";
        }
    }
    prompt += "\nText: " + text + "\n\nCorrected:";
    return prompt;
}

StageResult<CorrectionResult>
OllamaCorrector::correct(const std::string& text, const std::map<std::string, std::string>& dictionary,
                         const StageContext& ctx) {
    auto start = std::chrono::steady_clock::now();
    auto res = client_.generate(model_, build_prompt(text, dictionary),
                                GenerateOptions{.temperature = 0.1, .num_predict = 500}, ctx);
    double processing_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (!res) return std::unexpected(res.error());
    if (res->empty()) {
        return std::unexpected(StageError::failure("corrector returned empty text"));
    }
    return CorrectionResult{.text = std::move(*res), .processing_s = processing_s};
}
