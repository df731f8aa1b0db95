#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// JSON mirror of the daemon state for status bars and scripts. Written
// atomically (temp file + rename) so readers never see a torn file. The
// daemon never reads it back.
class StateFile {
public:
    explicit StateFile(std::string path);

    std::expected<void, std::string> write(const nlohmann::json& state);
    std::expected<nlohmann::json, std::string> read() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
