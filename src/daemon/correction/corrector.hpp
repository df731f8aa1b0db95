#pragma once

#include "pipeline/stage.hpp"

#include <map>
#include <string>

struct CorrectionResult {
    std::string text;
    double processing_s = 0.0;
};

// Optional text clean-up stage (grammar, punctuation, names).
class Corrector {
public:
    virtual ~Corrector() = default;
    virtual StageResult<CorrectionResult>
        correct(const std::string& text, const std::map<std::string, std::string>& dictionary,
                const StageContext& ctx) = 0;
};
