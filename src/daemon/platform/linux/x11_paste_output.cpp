#include "platform/linux/x11_paste_output.hpp"

#include "platform/subprocess.hpp"

#include <chrono>
#include <thread>

X11PasteOutput::X11PasteOutput(bool terminal_paste)
    : terminal_paste_(terminal_paste) {}

std::expected<void, std::string> X11PasteOutput::deliver(const std::string& text, std::stop_token stop) {
    auto res = platform::run_checked({"xclip", "-selection", "clipboard"}, text, stop);
    if (!res) return res;

    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    if (stop.stop_requested()) return std::unexpected(std::string("interrupted"));

    return platform::run_checked({"xdotool", "key", "--clearmodifiers",
                                  terminal_paste_ ? "ctrl+shift+v" : "ctrl+v"}, {}, stop);
}
