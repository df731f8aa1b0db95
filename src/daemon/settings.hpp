#pragma once

#include "config.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class OutputMode { RawOnly, CorrectedOnly, Both };

std::string_view to_string(OutputMode mode);
// Accepts "raw", "corrected", "both" and the aliases "whisper", "ollama".
std::optional<OutputMode> parse_output_mode(std::string_view name);

// The mutable part of the configuration. Sessions hold an immutable snapshot.
struct Settings {
    uint64_t version = 0;
    OutputMode output_mode = OutputMode::CorrectedOnly;
    bool correction_enabled = true;
    std::vector<std::string> vocabulary;
    std::map<std::string, std::string> corrections;
};

// Versioned, thread-safe holder of Settings. Every update publishes a new
// immutable snapshot; readers never observe a partially applied change.
class SettingsStore {
public:
    explicit SettingsStore(Settings initial = {});

    static Settings from_config(const Config& config);

    std::shared_ptr<const Settings> snapshot() const;

    // Applies the mutation to a copy, bumps the version and publishes it.
    // Persists to the backing file when one is attached.
    std::shared_ptr<const Settings> update(const std::function<void(Settings&)>& mutate);

    // Overlays persisted values (if the file exists) and attaches the path for saves.
    std::expected<void, std::string> attach(const std::string& path);

private:
    std::expected<void, std::string> save(const Settings& settings) const;

    mutable std::mutex mu_;
    std::shared_ptr<const Settings> current_;
    std::string path_;
};
