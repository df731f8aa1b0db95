#pragma once

#include "output/output.hpp"

// Copies to the clipboard, then sends the paste shortcut with wtype.
class WaylandTypeOutput : public OutputMethod {
public:
    explicit WaylandTypeOutput(bool terminal_paste = false);
    std::expected<void, std::string> deliver(const std::string& text, std::stop_token stop) override;
    std::string name() const override { return "wtype"; }

private:
    bool terminal_paste_;
};
