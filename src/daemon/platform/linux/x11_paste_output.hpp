#pragma once

#include "output/output.hpp"

// X11 fallback: xclip for the selection, xdotool for the paste shortcut.
class X11PasteOutput : public OutputMethod {
public:
    explicit X11PasteOutput(bool terminal_paste = false);
    std::expected<void, std::string> deliver(const std::string& text, std::stop_token stop) override;
    std::string name() const override { return "xdotool"; }

private:
    bool terminal_paste_;
};
