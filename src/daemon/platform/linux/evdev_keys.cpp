#include "platform/linux/evdev_keys.hpp"

#include <algorithm>
#include <iterator>
#include <linux/input-event-codes.h>
#include <print>
#include <utility>

namespace evdev {

namespace {

constexpr std::pair<std::string_view, int> kKeys[] = {
    {"KEY_LEFTMETA", KEY_LEFTMETA},
    {"KEY_RIGHTMETA", KEY_RIGHTMETA},
    {"KEY_LEFTALT", KEY_LEFTALT},
    {"KEY_RIGHTALT", KEY_RIGHTALT},
    {"KEY_LEFTCTRL", KEY_LEFTCTRL},
    {"KEY_RIGHTCTRL", KEY_RIGHTCTRL},
    {"KEY_LEFTSHIFT", KEY_LEFTSHIFT},
    {"KEY_RIGHTSHIFT", KEY_RIGHTSHIFT},
    {"KEY_CAPSLOCK", KEY_CAPSLOCK},
    {"KEY_COMPOSE", KEY_COMPOSE},
    {"KEY_PAGEDOWN", KEY_PAGEDOWN},
    {"KEY_PAGEUP", KEY_PAGEUP},
    {"KEY_HOME", KEY_HOME},
    {"KEY_END", KEY_END},
    {"KEY_INSERT", KEY_INSERT},
    {"KEY_DELETE", KEY_DELETE},
    {"KEY_PAUSE", KEY_PAUSE},
    {"KEY_SCROLLLOCK", KEY_SCROLLLOCK},
    {"KEY_SYSRQ", KEY_SYSRQ},
    {"KEY_RIGHT", KEY_RIGHT},
    {"KEY_LEFT", KEY_LEFT},
    {"KEY_UP", KEY_UP},
    {"KEY_DOWN", KEY_DOWN},
    {"KEY_SPACE", KEY_SPACE},
    {"KEY_ENTER", KEY_ENTER},
    {"KEY_TAB", KEY_TAB},
    {"KEY_ESC", KEY_ESC},
    {"KEY_BACKSPACE", KEY_BACKSPACE},
    {"KEY_GRAVE", KEY_GRAVE},
    {"KEY_A", KEY_A},
    {"KEY_B", KEY_B},
    {"KEY_C", KEY_C},
    {"KEY_D", KEY_D},
    {"KEY_E", KEY_E},
    {"KEY_F", KEY_F},
    {"KEY_G", KEY_G},
    {"KEY_H", KEY_H},
    {"KEY_I", KEY_I},
    {"KEY_J", KEY_J},
    {"KEY_K", KEY_K},
    {"KEY_L", KEY_L},
    {"KEY_M", KEY_M},
    {"KEY_N", KEY_N},
    {"KEY_O", KEY_O},
    {"KEY_P", KEY_P},
    {"KEY_Q", KEY_Q},
    {"KEY_R", KEY_R},
    {"KEY_S", KEY_S},
    {"KEY_T", KEY_T},
    {"KEY_U", KEY_U},
    {"KEY_V", KEY_V},
    {"KEY_W", KEY_W},
    {"KEY_X", KEY_X},
    {"KEY_Y", KEY_Y},
    {"KEY_Z", KEY_Z},
    {"KEY_0", KEY_0},
    {"KEY_1", KEY_1},
    {"KEY_2", KEY_2},
    {"KEY_3", KEY_3},
    {"KEY_4", KEY_4},
    {"KEY_5", KEY_5},
    {"KEY_6", KEY_6},
    {"KEY_7", KEY_7},
    {"KEY_8", KEY_8},
    {"KEY_9", KEY_9},
    {"KEY_F1", KEY_F1},
    {"KEY_F2", KEY_F2},
    {"KEY_F3", KEY_F3},
    {"KEY_F4", KEY_F4},
    {"KEY_F5", KEY_F5},
    {"KEY_F6", KEY_F6},
    {"KEY_F7", KEY_F7},
    {"KEY_F8", KEY_F8},
    {"KEY_F9", KEY_F9},
    {"KEY_F10", KEY_F10},
    {"KEY_F11", KEY_F11},
    {"KEY_F12", KEY_F12},
    {"KEY_F13", KEY_F13},
    {"KEY_F14", KEY_F14},
    {"KEY_F15", KEY_F15},
    {"KEY_F16", KEY_F16},
    {"KEY_F17", KEY_F17},
    {"KEY_F18", KEY_F18},
    {"KEY_F19", KEY_F19},
    {"KEY_F20", KEY_F20},
    {"KEY_F21", KEY_F21},
    {"KEY_F22", KEY_F22},
    {"KEY_F23", KEY_F23},
    {"KEY_F24", KEY_F24},
    {"KEY_MICMUTE", KEY_MICMUTE},
    {"KEY_RECORD", KEY_RECORD},
    {"KEY_MEDIA", KEY_MEDIA},
};

} // namespace

std::optional<int> key_code(std::string_view name) {
    auto it = std::ranges::find(kKeys, name, &std::pair<std::string_view, int>::first);
    if (it == std::end(kKeys)) return std::nullopt;
    return it->second;
}

std::vector<std::set<int>> resolve_combos(const std::vector<std::vector<std::string>>& combos) {
    std::vector<std::set<int>> out;
    for (auto& combo : combos) {
        std::set<int> codes;
        bool ok = !combo.empty();
        for (auto& name : combo) {
            auto code = key_code(name);
            if (!code) {
                std::println(stderr, "hotkey: unknown key {}, combo ignored", name);
                ok = false;
                break;
            }
            codes.insert(*code);
        }
        if (ok) out.push_back(std::move(codes));
    }
    return out;
}

} // namespace evdev
