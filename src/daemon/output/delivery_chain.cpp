#include "output/delivery_chain.hpp"

DeliveryChain::DeliveryChain(std::vector<std::unique_ptr<OutputMethod>> methods)
    : methods_(std::move(methods)) {}

void DeliveryChain::add(std::unique_ptr<OutputMethod> method) {
    methods_.push_back(std::move(method));
}

StageResult<DeliveryReport> DeliveryChain::deliver(const std::string& text, const StageContext& ctx) {
    if (methods_.empty()) {
        return std::unexpected(StageError::failure("no output methods configured"));
    }

    DeliveryReport report;
    for (auto& method : methods_) {
        if (ctx.stop.stop_requested()) {
            return std::unexpected(StageError::cancelled());
        }

        auto res = method->deliver(text, ctx.stop);
        if (res) {
            report.backend = method->name();
            return report;
        }
        if (ctx.stop.stop_requested()) {
            return std::unexpected(StageError::cancelled(method->name() + ": " + res.error()));
        }
        report.failures.push_back(method->name() + ": " + res.error());
    }

    std::string message = "all output methods failed";
    for (auto& f : report.failures) {
        message += "; " + f;
    }
    return std::unexpected(StageError::failure(std::move(message)));
}
