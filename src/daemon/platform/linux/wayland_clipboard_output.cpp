#include "platform/linux/wayland_clipboard_output.hpp"

#include "platform/subprocess.hpp"

std::expected<void, std::string> WaylandClipboardOutput::deliver(const std::string& text, std::stop_token stop) {
    return platform::run_checked({"wl-copy"}, text, stop);
}
