#pragma once

#include "audio/audio_source.hpp"
#include "config.hpp"
#include "control.hpp"
#include "correction/ollama_corrector.hpp"
#include "net/http_client.hpp"
#include "net/ollama_client.hpp"
#include "orchestrator.hpp"
#include "output/delivery_chain.hpp"
#include "platform/linux/command_synthesizer.hpp"
#include "platform/linux/desktop_notifier.hpp"
#include "platform/linux/evdev_keyboard_monitor.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "ring_buffer.hpp"
#include "settings.hpp"
#include "speech/speech_service.hpp"
#include "speech/summarizer.hpp"
#include "speech/voice_gate.hpp"
#include "state_file.hpp"
#include "storage/history_db.hpp"
#include "trigger/trigger_channel.hpp"
#include "trigger/wake_word_gate.hpp"
#include "whisper/lan_backend.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <memory>
#include <vector>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    // Returns the process exit code.
    int run();
    void request_stop();

private:
    bool setup_fds();
    void check_correction_model();
    bool add_fd(int fd);
    void on_client(int fd);
    void drop_client(int fd);
    void on_session_finished(const nlohmann::json& summary);
    void on_state_change(SessionState state);
    void drain_triggers();
    void shutdown();

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before the core)
    RingBuffer ring_buf_;
    PipeWireCapture audio_capture_;
    UnixSocketServer ipc_server_;
    DesktopNotifier notifier_;
    CommandSynthesizer synthesizer_;

    HttpClient http_;
    OllamaClient ollama_;
    LanBackend transcriber_;
    OllamaCorrector corrector_;
    OllamaSummarizer summarizer_;
    DeliveryChain delivery_;
    HistoryDb history_;
    SettingsStore settings_;
    StateFile state_file_;
    WorkerPool workers_;

    AudioSource audio_;
    TriggerChannel triggers_;
    WakeWordGate wake_gate_;
    VoiceGate voice_gate_;
    std::unique_ptr<SpeechService> speech_;
    std::unique_ptr<EvdevKeyboardMonitor> keyboard_;

    // Portable business logic
    Orchestrator orchestrator_;
    Control control_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int trigger_event_fd_ = -1;
    int timer_fd_ = -1;

    std::vector<int> waiting_clients_;
    std::atomic<bool> running_{false};
};
