#pragma once

#include "net/ollama_client.hpp"

#include <chrono>
#include <stop_token>
#include <string>
#include <string_view>

struct Summary {
    std::string text;
    bool summarized = false; // false when the fallback truncation was used
    double latency_ms = 0.0;
};

// Shortens long notifications before they are spoken.
class Summarizer {
public:
    virtual ~Summarizer() = default;
    virtual Summary summarize(const std::string& text, std::stop_token stop) = 0;
};

class OllamaSummarizer : public Summarizer {
public:
    OllamaSummarizer(const OllamaClient& client, std::string model,
                     std::chrono::milliseconds timeout);

    Summary summarize(const std::string& text, std::stop_token stop) override;

    static std::string build_prompt(std::string_view text);
    // The first two sentences of `text`, or all of it when it has fewer.
    static std::string truncate(std::string_view text);

private:
    const OllamaClient& client_;
    std::string model_;
    std::chrono::milliseconds timeout_;
};
