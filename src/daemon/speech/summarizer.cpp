#include "speech/summarizer.hpp"

#include "pipeline/text_rules.hpp"

#include <print>

namespace {

constexpr size_t kMaxInputChars = 2000;

} // namespace

OllamaSummarizer::OllamaSummarizer(const OllamaClient& client, std::string model,
                                   std::chrono::milliseconds timeout)
    : client_(client), model_(std::move(model)), timeout_(timeout) {}

std::string OllamaSummarizer::build_prompt(std::string_view text) {
    text = text::utf8_prefix(text, kMaxInputChars);
    std::string prompt =
        "Summarize this in 1-2 short sentences suitable for text-to-speech. "
        "Be concise and conversational. Output ONLY the summary, nothing else.\n\n";
    prompt += "Text: ";
    prompt += text;
    prompt += "\n\nSummary:";
    return prompt;
}

std::string OllamaSummarizer::truncate(std::string_view text) {
    auto trimmed = text::trim(text);
    int sentences = 0;
    for (size_t i = 0; i < trimmed.size(); ++i) {
        char c = trimmed[i];
        if (c == '.' || c == '!' || c == '?') {
            if (++sentences == 2) return trimmed.substr(0, i + 1);
        }
    }
    return trimmed;
}

Summary OllamaSummarizer::summarize(const std::string& text, std::stop_token stop) {
    auto start = std::chrono::steady_clock::now();
    auto res = client_.generate(model_, build_prompt(text),
                                GenerateOptions{.temperature = 0.3, .num_predict = 200},
                                StageContext{.stop = stop, .timeout = timeout_});
    double ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    if (!res || res->empty()) {
        if (!res && res.error().kind != StageError::Kind::Cancelled) {
            std::println(stderr, "summarizer: {}, truncating instead", res.error().message);
        }
        return Summary{.text = truncate(text), .summarized = false, .latency_ms = ms};
    }
    return Summary{.text = std::move(*res), .summarized = true, .latency_ms = ms};
}
