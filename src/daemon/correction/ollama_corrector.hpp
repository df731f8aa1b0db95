#pragma once

#include "correction/corrector.hpp"
#include "net/ollama_client.hpp"

#include <string>

class OllamaCorrector : public Corrector {
public:
    OllamaCorrector(const OllamaClient& client, std::string model);

    StageResult<CorrectionResult>
        correct(const std::string& text, const std::map<std::string, std::string>& dictionary,
                const StageContext& ctx) override;

    static std::string build_prompt(const std::string& text,
                                    const std::map<std::string, std::string>& dictionary);

private:
    const OllamaClient& client_;
    std::string model_;
};
