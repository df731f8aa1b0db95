#include "trigger/chord_matcher.hpp"

#include <algorithm>

ChordMatcher::ChordMatcher(std::vector<std::set<int>> combos)
    : combos_(std::move(combos)) {
    std::erase_if(combos_, [](const std::set<int>& c) { return c.empty(); });
}

ChordMatcher::Edge ChordMatcher::on_key(int code, int value) {
    switch (value) {
        case 1: pressed_.insert(code); break;
        case 0: pressed_.erase(code); break;
        default: return Edge::None;
    }

    bool now = any_combo_held();
    if (now == active_) return Edge::None;

    active_ = now;
    return now ? Edge::Pressed : Edge::Released;
}

ChordMatcher::Edge ChordMatcher::reset() {
    pressed_.clear();
    if (!active_) return Edge::None;
    active_ = false;
    return Edge::Released;
}

bool ChordMatcher::any_combo_held() const {
    return std::ranges::any_of(combos_, [this](const std::set<int>& combo) {
        return std::ranges::includes(pressed_, combo);
    });
}
