#include "platform/linux/wayland_type_output.hpp"

#include "platform/linux/wayland_clipboard_output.hpp"
#include "platform/subprocess.hpp"

#include <chrono>
#include <thread>

WaylandTypeOutput::WaylandTypeOutput(bool terminal_paste)
    : terminal_paste_(terminal_paste) {}

std::expected<void, std::string> WaylandTypeOutput::deliver(const std::string& text, std::stop_token stop) {
    WaylandClipboardOutput clip;
    auto res = clip.deliver(text, stop);
    if (!res) return res;

    // Give the compositor a moment to publish the new selection.
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    if (stop.stop_requested()) return std::unexpected(std::string("interrupted"));

    if (terminal_paste_) {
        return platform::run_checked({"wtype", "-M", "ctrl", "-M", "shift", "-k", "v"}, {}, stop);
    }
    return platform::run_checked({"wtype", "-M", "ctrl", "-k", "v"}, {}, stop);
}
