#include "platform/linux/evdev_keyboard_monitor.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <linux/input.h>
#include <poll.h>
#include <print>
#include <sys/eventfd.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr int kRescanMs = 5000;

bool test_bit(const unsigned long* bits, int bit) {
    constexpr int kBits = sizeof(unsigned long) * CHAR_BIT;
    return (bits[bit / kBits] >> (bit % kBits)) & 1UL;
}

// Anything reporting letter keys counts as a keyboard.
bool is_keyboard(int fd) {
    constexpr int kBits = sizeof(unsigned long) * CHAR_BIT;
    unsigned long keys[(KEY_MAX + kBits) / kBits] = {};
    if (::ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keys)), keys) < 0) return false;
    return test_bit(keys, KEY_A) && test_bit(keys, KEY_Z);
}

} // namespace

EvdevKeyboardMonitor::EvdevKeyboardMonitor(ChordMatcher matcher, TriggerChannel& channel,
                                           bool verbose)
    : matcher_(std::move(matcher)), channel_(channel), verbose_(verbose) {}

EvdevKeyboardMonitor::~EvdevKeyboardMonitor() {
    stop();
}

bool EvdevKeyboardMonitor::start() {
    if (matcher_.empty()) {
        std::println(stderr, "hotkey: no valid combos configured");
        return false;
    }

    scan_devices();
    if (devices_.empty()) {
        std::println(stderr, "hotkey: no readable keyboards in /dev/input (is the user in the input group?)");
        return false;
    }

    stop_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (stop_fd_ < 0) {
        std::println(stderr, "hotkey: eventfd failed: {}", std::strerror(errno));
        return false;
    }

    thread_ = std::jthread([this](std::stop_token st) { run(st); });
    return true;
}

void EvdevKeyboardMonitor::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        uint64_t one = 1;
        if (::write(stop_fd_, &one, sizeof(one)) < 0) {
            std::println(stderr, "hotkey: failed to wake monitor thread: {}", std::strerror(errno));
        }
        thread_.join();
    }
    while (!devices_.empty()) close_device(devices_.size() - 1);
    if (stop_fd_ >= 0) {
        ::close(stop_fd_);
        stop_fd_ = -1;
    }
}

void EvdevKeyboardMonitor::scan_devices() {
    std::error_code ec;
    for (auto& entry : fs::directory_iterator("/dev/input", ec)) {
        auto path = entry.path().string();
        if (!entry.path().filename().string().starts_with("event")) continue;
        if (std::ranges::any_of(devices_, [&](const Device& d) { return d.path == path; })) continue;

        int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) continue;
        if (!is_keyboard(fd)) {
            ::close(fd);
            continue;
        }
        devices_.push_back({fd, path});
        log("watching " + path);
    }
}

void EvdevKeyboardMonitor::close_device(size_t index) {
    ::close(devices_[index].fd);
    devices_.erase(devices_.begin() + static_cast<std::ptrdiff_t>(index));
}

void EvdevKeyboardMonitor::handle_edge(ChordMatcher::Edge edge) {
    bool ok = true;
    if (edge == ChordMatcher::Edge::Pressed) {
        ok = channel_.push(TriggerEvent::start(TriggerSource::Chord));
    } else if (edge == ChordMatcher::Edge::Released) {
        ok = channel_.push(TriggerEvent::stop(TriggerSource::Chord));
    }
    if (!ok) std::println(stderr, "hotkey: trigger queue full, edge dropped");
}

void EvdevKeyboardMonitor::run(std::stop_token st) {
    std::vector<pollfd> pfds;

    while (!st.stop_requested()) {
        pfds.clear();
        pfds.push_back({.fd = stop_fd_, .events = POLLIN, .revents = 0});
        for (auto& d : devices_) pfds.push_back({.fd = d.fd, .events = POLLIN, .revents = 0});

        int n = ::poll(pfds.data(), pfds.size(), kRescanMs);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "hotkey: poll failed: {}", std::strerror(errno));
            return;
        }
        if (n == 0) {
            scan_devices();
            continue;
        }
        if (pfds[0].revents & POLLIN) return;

        // Walk backwards so closing a device keeps earlier indices valid.
        for (size_t i = pfds.size() - 1; i >= 1; --i) {
            size_t dev = i - 1;
            if (pfds[i].revents == 0) continue;

            bool lost = (pfds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) != 0;
            input_event ev[64];
            while (!lost) {
                ssize_t r = ::read(devices_[dev].fd, ev, sizeof(ev));
                if (r < 0) {
                    if (errno != EAGAIN && errno != EINTR) lost = true;
                    break;
                }
                if (r == 0) {
                    lost = true;
                    break;
                }
                size_t count = static_cast<size_t>(r) / sizeof(input_event);
                for (size_t k = 0; k < count; ++k) {
                    if (ev[k].type != EV_KEY) continue;
                    handle_edge(matcher_.on_key(ev[k].code, ev[k].value));
                }
            }

            if (lost) {
                std::println(stderr, "hotkey: lost {}", devices_[dev].path);
                close_device(dev);
                // Held keys on the vanished device will never report release.
                handle_edge(matcher_.reset());
            }
        }
    }
}

void EvdevKeyboardMonitor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[push-dictate] hotkey: {}", msg);
    }
}
