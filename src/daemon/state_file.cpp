#include "state_file.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

StateFile::StateFile(std::string path)
    : path_(std::move(path)) {}

std::expected<void, std::string> StateFile::write(const nlohmann::json& state) {
    fs::path p(path_);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    auto tmp = p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected("state: could not open " + tmp.string());
        }
        out << state.dump(2) << '\n';
        if (!out) return std::unexpected("state: short write to " + tmp.string());
    }

    fs::rename(tmp, p, ec);
    if (ec) return std::unexpected("state: rename failed: " + ec.message());
    return {};
}

std::expected<nlohmann::json, std::string> StateFile::read() const {
    std::ifstream in(path_);
    if (!in.is_open()) return std::unexpected("state: could not open " + path_);
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string("state: parse error: ") + e.what());
    }
}
