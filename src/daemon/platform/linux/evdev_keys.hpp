#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace evdev {

// "KEY_LEFTMETA" -> KEY_LEFTMETA. Unknown names yield nullopt.
std::optional<int> key_code(std::string_view name);

// Resolves configured combos. A combo with an unknown key is dropped with a
// warning naming the key.
std::vector<std::set<int>> resolve_combos(const std::vector<std::vector<std::string>>& combos);

} // namespace evdev
