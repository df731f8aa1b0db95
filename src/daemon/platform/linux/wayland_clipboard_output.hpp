#pragma once

#include "output/output.hpp"

// Leaves the text on the Wayland clipboard (wl-copy).
class WaylandClipboardOutput : public OutputMethod {
public:
    std::expected<void, std::string> deliver(const std::string& text, std::stop_token stop) override;
    std::string name() const override { return "clipboard"; }
};
