#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Turns `push-dictate-ctl <command> [args...]` into the socket request.
// args excludes the program name.
std::expected<nlohmann::json, std::string> build_command(const std::vector<std::string>& args);
