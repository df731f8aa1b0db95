#pragma once

#include "output/output.hpp"
#include "pipeline/stage.hpp"

#include <memory>
#include <string>
#include <vector>

struct DeliveryReport {
    std::string backend;               // the method that succeeded
    std::vector<std::string> failures; // "<name>: <error>" for each method tried before it
};

// Ordered fallback over output methods; the first success wins.
class DeliveryChain {
public:
    DeliveryChain() = default;
    explicit DeliveryChain(std::vector<std::unique_ptr<OutputMethod>> methods);

    void add(std::unique_ptr<OutputMethod> method);

    StageResult<DeliveryReport> deliver(const std::string& text, const StageContext& ctx);

    size_t size() const { return methods_.size(); }

private:
    std::vector<std::unique_ptr<OutputMethod>> methods_;
};
