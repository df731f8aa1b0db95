#include "settings.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string_view to_string(OutputMode mode) {
    switch (mode) {
        case OutputMode::RawOnly: return "raw";
        case OutputMode::CorrectedOnly: return "corrected";
        case OutputMode::Both: return "both";
    }
    return "corrected";
}

std::optional<OutputMode> parse_output_mode(std::string_view name) {
    if (name == "raw" || name == "whisper" || name == "whisper_only") return OutputMode::RawOnly;
    if (name == "corrected" || name == "ollama" || name == "ollama_only") return OutputMode::CorrectedOnly;
    if (name == "both") return OutputMode::Both;
    return std::nullopt;
}

SettingsStore::SettingsStore(Settings initial)
    : current_(std::make_shared<const Settings>(std::move(initial))) {}

Settings SettingsStore::from_config(const Config& config) {
    Settings s;
    if (auto mode = parse_output_mode(config.output.mode)) {
        s.output_mode = *mode;
    } else {
        std::println(stderr, "settings: unknown output mode '{}', using corrected", config.output.mode);
    }
    s.correction_enabled = config.correction.enabled;
    s.vocabulary = config.vocabulary;
    s.corrections = config.corrections;
    return s;
}

std::shared_ptr<const Settings> SettingsStore::snapshot() const {
    std::lock_guard lock(mu_);
    return current_;
}

std::shared_ptr<const Settings> SettingsStore::update(const std::function<void(Settings&)>& mutate) {
    std::shared_ptr<const Settings> published;
    {
        std::lock_guard lock(mu_);
        auto next = std::make_shared<Settings>(*current_);
        mutate(*next);
        next->version = current_->version + 1;
        current_ = next;
        published = current_;
    }

    if (!path_.empty()) {
        if (auto res = save(*published); !res) {
            std::println(stderr, "settings: {}", res.error());
        }
    }
    return published;
}

std::expected<void, std::string> SettingsStore::attach(const std::string& path) {
    path_ = path;
    if (!fs::exists(path)) return {};

    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected("could not open " + path);
    }

    try {
        auto j = json::parse(f);
        std::lock_guard lock(mu_);
        auto next = std::make_shared<Settings>(*current_);
        if (j.contains("output_mode")) {
            if (auto mode = parse_output_mode(j["output_mode"].get<std::string>())) {
                next->output_mode = *mode;
            }
        }
        if (j.contains("correction_enabled")) next->correction_enabled = j["correction_enabled"].get<bool>();
        if (j.contains("vocabulary")) next->vocabulary = j["vocabulary"].get<std::vector<std::string>>();
        if (j.contains("corrections")) {
            next->corrections = j["corrections"].get<std::map<std::string, std::string>>();
        }
        next->version = current_->version + 1;
        current_ = next;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("parse error in ") + path + ": " + e.what());
    }
    return {};
}

std::expected<void, std::string> SettingsStore::save(const Settings& settings) const {
    json j = {
        {"output_mode", std::string(to_string(settings.output_mode))},
        {"correction_enabled", settings.correction_enabled},
        {"vocabulary", settings.vocabulary},
        {"corrections", settings.corrections},
    };

    fs::path p(path_);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    auto tmp = p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp);
        if (!out.is_open()) return std::unexpected("could not write " + tmp.string());
        out << j.dump(2) << '\n';
        if (!out) return std::unexpected("short write to " + tmp.string());
    }
    fs::rename(tmp, p, ec);
    if (ec) return std::unexpected("rename failed: " + ec.message());
    return {};
}
