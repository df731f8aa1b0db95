#include "net/ollama_client.hpp"

#include "pipeline/text_rules.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

OllamaClient::OllamaClient(const HttpClient& http, std::string host)
    : http_(http), host_(std::move(host)) {
    while (!host_.empty() && host_.back() == '/') host_.pop_back();
}

StageResult<std::string> OllamaClient::generate(const std::string& model, const std::string& prompt,
                                                const GenerateOptions& options,
                                                const StageContext& ctx) const {
    std::string body;
    try {
        json request = {
            {"model", model},
            {"prompt", prompt},
            {"stream", false},
            {"options", {
                {"temperature", options.temperature},
                {"num_predict", options.num_predict},
            }},
        };
        body = request.dump();
    } catch (const json::exception& e) {
        return std::unexpected(StageError::failure(std::string("ollama: bad request: ") + e.what()));
    }

    auto resp = http_.post_json(host_ + "/api/generate", body, ctx);
    if (!resp) return std::unexpected(resp.error());

    try {
        auto j = json::parse(resp->body);
        if (j.contains("error")) {
            return std::unexpected(StageError::failure("ollama: " + j["error"].get<std::string>()));
        }
        if (!j.contains("response")) {
            return std::unexpected(StageError::failure("ollama: response field missing"));
        }
        return text::trim(j["response"].get<std::string>());
    } catch (const json::exception& e) {
        return std::unexpected(StageError::failure(std::string("ollama: JSON parse error: ") + e.what()));
    }
}

StageResult<std::vector<std::string>> OllamaClient::list_models(const StageContext& ctx) const {
    auto resp = http_.get(host_ + "/api/tags", ctx);
    if (!resp) return std::unexpected(resp.error());

    try {
        auto j = json::parse(resp->body);
        std::vector<std::string> names;
        if (j.contains("models")) {
            for (auto& m : j["models"]) {
                names.push_back(m.value("name", ""));
            }
        }
        return names;
    } catch (const json::exception& e) {
        return std::unexpected(StageError::failure(std::string("ollama: JSON parse error: ") + e.what()));
    }
}

bool OllamaClient::has_model(const std::vector<std::string>& installed, std::string_view model) {
    if (model.empty()) return false;
    bool tagged = model.find(':') != std::string_view::npos;
    for (const auto& name : installed) {
        if (name == model) return true;
        std::string_view base(name);
        base = base.substr(0, base.find(':'));
        if (!tagged && base == model) return true;
    }
    return false;
}
