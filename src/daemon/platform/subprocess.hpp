#pragma once

#include <expected>
#include <stop_token>
#include <string>
#include <vector>

namespace platform {

struct ProcessExit {
    int code = 0;
    bool killed = false; // terminated because the stop token fired
};

// Runs argv[0] from PATH with `input` on stdin and waits for it. When `stop`
// fires the child is sent SIGTERM and reaped.
std::expected<ProcessExit, std::string> run_process(const std::vector<std::string>& argv,
                                                    const std::string& input = {},
                                                    std::stop_token stop = {});

// Convenience: success only for a zero exit status. A child killed by `stop`
// is an error.
std::expected<void, std::string> run_checked(const std::vector<std::string>& argv,
                                             const std::string& input = {},
                                             std::stop_token stop = {});

} // namespace platform
