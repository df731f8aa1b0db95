#pragma once

#include <set>
#include <vector>

// Tracks held keys and reports edges of "any configured combo fully held".
// Key codes are opaque integers (evdev codes on Linux).
class ChordMatcher {
public:
    enum class Edge { None, Pressed, Released };

    explicit ChordMatcher(std::vector<std::set<int>> combos);

    // value: 0 = release, 1 = press, 2 = autorepeat (ignored).
    Edge on_key(int code, int value);

    // Forget held keys, e.g. after a device disappeared. Emits Released if a
    // combo was active.
    Edge reset();

    bool active() const { return active_; }
    bool empty() const { return combos_.empty(); }

private:
    bool any_combo_held() const;

    std::vector<std::set<int>> combos_;
    std::set<int> pressed_;
    bool active_ = false;
};
