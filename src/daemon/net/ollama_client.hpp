#pragma once

#include "net/http_client.hpp"
#include "pipeline/stage.hpp"

#include <string>
#include <string_view>
#include <vector>

struct GenerateOptions {
    double temperature = 0.1;
    int num_predict = 500;
};

// Minimal client for an Ollama server (non-streaming /api/generate, /api/tags).
class OllamaClient {
public:
    OllamaClient(const HttpClient& http, std::string host);

    StageResult<std::string> generate(const std::string& model, const std::string& prompt,
                                      const GenerateOptions& options, const StageContext& ctx) const;

    StageResult<std::vector<std::string>> list_models(const StageContext& ctx) const;

    // "llama3" matches any tag of llama3; "llama3:8b" only that tag.
    static bool has_model(const std::vector<std::string>& installed, std::string_view model);

    const std::string& host() const { return host_; }

private:
    const HttpClient& http_;
    std::string host_;
};
