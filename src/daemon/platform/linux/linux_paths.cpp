#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

std::string xdg_dir(const char* env, const char* fallback) {
    const char* xdg = std::getenv(env);
    if (xdg && *xdg) return std::string(xdg) + "/push-dictate";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + fallback + "/push-dictate";
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", "/.local/share");
}

std::string cache_dir() {
    return xdg_dir("XDG_CACHE_HOME", "/.cache");
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/push-dictate.sock";
    return "/tmp/push-dictate.sock";
}

} // namespace platform
