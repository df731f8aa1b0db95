#pragma once

#include "trigger/chord_matcher.hpp"
#include "trigger/trigger_channel.hpp"

#include <string>
#include <thread>
#include <vector>

// Watches every keyboard under /dev/input and turns chord edges into
// Start/Stop triggers. Runs on its own thread; the matcher state is shared
// across devices so a chord may span two keyboards.
class EvdevKeyboardMonitor {
public:
    EvdevKeyboardMonitor(ChordMatcher matcher, TriggerChannel& channel, bool verbose = false);
    ~EvdevKeyboardMonitor();

    EvdevKeyboardMonitor(const EvdevKeyboardMonitor&) = delete;
    EvdevKeyboardMonitor& operator=(const EvdevKeyboardMonitor&) = delete;

    // Returns false when no keyboard could be opened (usually missing
    // membership in the "input" group).
    bool start();
    void stop();

private:
    struct Device {
        int fd;
        std::string path;
    };

    void scan_devices();
    void close_device(size_t index);
    void run(std::stop_token st);
    void handle_edge(ChordMatcher::Edge edge);
    void log(const std::string& msg);

    ChordMatcher matcher_;
    TriggerChannel& channel_;
    bool verbose_;

    std::vector<Device> devices_;
    int stop_fd_ = -1;
    std::jthread thread_;
};
