#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct Config {
    struct Backend {
        std::string type = "lan";
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "en";
        uint32_t timeout_ms = 30000;
    } backend;

    struct Correction {
        bool enabled = true;
        std::string host = "http://localhost:11434";
        std::string model = "llama3.2:3b";
        uint32_t timeout_ms = 5000;
    } correction;

    struct Output {
        std::string mode = "corrected"; // "raw", "corrected" or "both"
        // Tried in order, first success wins: "wtype", "xdotool", "clipboard".
        std::vector<std::string> backends = {"wtype", "xdotool", "clipboard"};
        bool terminal_paste = true;     // ctrl+shift+v instead of ctrl+v
    } output;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 120;     // ceiling for manual sessions
        uint32_t preroll_ms = 500;
        uint32_t ring_ms = 2000;        // RT thread -> event loop handoff

        size_t ring_buffer_samples() const {
            return static_cast<size_t>(ring_ms) * sample_rate / 1000;
        }
        size_t preroll_samples() const {
            return static_cast<size_t>(preroll_ms) * sample_rate / 1000;
        }
    } audio;

    struct Hotkey {
        bool enabled = true;
        std::vector<std::vector<std::string>> combos = {{"KEY_LEFTMETA", "KEY_LEFTALT"}};
    } hotkey;

    struct Silence {
        float threshold = 0.01f;
        double duration = 1.5;
        double max_recording_duration = 30.0; // ceiling for wake-word sessions
        double min_audio_seconds = 0.3;
    } silence;

    struct WakeWord {
        bool enabled = false;
        float threshold = 0.5f;
        uint32_t cooldown_ms = 2000;
        uint32_t debounce_ms = 300;
    } wakeword;

    struct Device {
        uint32_t retry_base_ms = 250;
        uint32_t retry_max_ms = 8000;
        uint32_t max_retries = 6;
    } device;

    struct Feedback {
        bool notifications = true;
    } feedback;

    struct Speech {
        bool enabled = true;
        // "{voice}" is substituted; the text is written to stdin.
        std::vector<std::string> command = {"espeak-ng", "-v", "{voice}", "--stdin"};
        std::string voice = "en-us";
        size_t max_direct_chars = 150;
        std::string summarize_model = "llama3.2:3b";
        uint32_t summarize_timeout_ms = 10000;
        uint32_t reminder_interval_s = 300;
        double reminder_backoff = 2.0;
        uint32_t max_reminders = 3;
    } speech;

    uint32_t workers = 2;

    std::vector<std::string> vocabulary;
    std::map<std::string, std::string> corrections;

    static Config load(const std::string& path);
    static Config load_default();
};
