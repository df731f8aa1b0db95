#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/evdev_keys.hpp"
#include "platform/linux/wayland_clipboard_output.hpp"
#include "platform/linux/wayland_type_output.hpp"
#include "platform/linux/x11_paste_output.hpp"
#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace {

constexpr long kTickNs = 20'000'000; // 20 ms
constexpr std::chrono::milliseconds kModelCheckTimeout{3000};

size_t max_capture_samples(const Config& config) {
    double seconds = std::max(static_cast<double>(config.audio.max_seconds),
                              config.silence.max_recording_duration) + 1.0;
    return static_cast<size_t>(seconds * config.audio.sample_rate);
}

std::string path_in(const std::string& dir, const std::string& file, const std::string& fallback) {
    return dir.empty() ? fallback : dir + "/" + file;
}

void signal_eventfd(int fd) {
    uint64_t val = 1;
    if (::write(fd, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        std::println(stderr, "loop: eventfd write failed: {}", std::strerror(errno));
    }
}

void drain_eventfd(int fd) {
    uint64_t val;
    while (::read(fd, &val, sizeof(val)) > 0) {}
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      ring_buf_(config_.audio.ring_buffer_samples()),
      audio_capture_(ring_buf_, config_.audio.sample_rate),
      notifier_(verbose_),
      synthesizer_(config_.speech.command),
      ollama_(http_, config_.correction.host),
      transcriber_(http_, config_.backend.url, config_.backend.api_format, config_.backend.language),
      corrector_(ollama_, config_.correction.model),
      summarizer_(ollama_, config_.speech.summarize_model,
                  std::chrono::milliseconds(config_.speech.summarize_timeout_ms)),
      settings_(SettingsStore::from_config(config_)),
      state_file_(path_in(platform::cache_dir(), "state.json", "/tmp/push-dictate/state.json")),
      workers_(config_.workers),
      audio_(ring_buf_, audio_capture_, config_.audio.sample_rate,
             config_.audio.preroll_samples(), max_capture_samples(config_)),
      wake_gate_(config_.wakeword.enabled, config_.wakeword.threshold,
                 std::chrono::milliseconds(config_.wakeword.cooldown_ms)),
      orchestrator_(config_,
                    Orchestrator::Collaborators{
                        .audio = audio_,
                        .transcriber = transcriber_,
                        .corrector = corrector_,
                        .delivery = delivery_,
                        .history = history_,
                        .notifier = notifier_,
                        .executor = workers_,
                        .settings = settings_,
                    },
                    verbose_),
      control_(Control::Deps{
                   .orchestrator = orchestrator_,
                   .settings = settings_,
                   .history = history_,
                   .triggers = triggers_,
                   .wake_gate = wake_gate_,
                   .speech = nullptr,
               },
               verbose_) {}

LinuxEventLoop::~LinuxEventLoop() {
    workers_.shutdown();
    for (int fd : {epoll_fd_, signal_fd_, worker_event_fd_, trigger_event_fd_, timer_fd_}) {
        if (fd >= 0) ::close(fd);
    }
}

bool LinuxEventLoop::init() {
    if (config_.backend.type != "lan") {
        std::println(stderr, "Unknown backend type: {}", config_.backend.type);
        return false;
    }

    // Output backends, in configured order
    for (auto& name : config_.output.backends) {
        if (name == "wtype") {
            delivery_.add(std::make_unique<WaylandTypeOutput>(config_.output.terminal_paste));
        } else if (name == "xdotool") {
            delivery_.add(std::make_unique<X11PasteOutput>(config_.output.terminal_paste));
        } else if (name == "clipboard") {
            delivery_.add(std::make_unique<WaylandClipboardOutput>());
        } else {
            std::println(stderr, "Unknown output backend: {}", name);
        }
    }
    if (delivery_.size() == 0) {
        std::println(stderr, "No usable output backend configured");
        return false;
    }

    // History and persisted settings
    auto data = platform::data_dir();
    if (!history_.open(path_in(data, "history.db", "/tmp/push-dictate/history.db"))) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }
    if (auto r = settings_.attach(path_in(data, "settings.json", "/tmp/push-dictate/settings.json")); !r) {
        std::println(stderr, "Warning: {}", r.error());
    }

    if (!setup_fds()) return false;

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    if (!add_fd(ipc_server_.server_fd())) return false;
    log("IPC listening on " + ipc_path);

    if (config_.correction.enabled) check_correction_model();

    // Speech notifications
    if (config_.speech.enabled) {
        speech_ = std::make_unique<SpeechService>(config_.speech, synthesizer_, summarizer_,
                                                  history_, voice_gate_, verbose_);
        control_.attach_speech(speech_.get());
    }

    // Producers wake the loop through eventfds
    int trig_fd = trigger_event_fd_;
    triggers_.set_wake([trig_fd] { signal_eventfd(trig_fd); });
    int work_fd = worker_event_fd_;
    orchestrator_.set_completion_wake([work_fd] { signal_eventfd(work_fd); });
    orchestrator_.set_state_file(&state_file_);
    orchestrator_.set_state_listener([this](SessionState s) { on_state_change(s); });
    orchestrator_.set_finished_listener([this](const nlohmann::json& j) { on_session_finished(j); });

    // Hotkey (optional)
    if (config_.hotkey.enabled) {
        keyboard_ = std::make_unique<EvdevKeyboardMonitor>(
            ChordMatcher(evdev::resolve_combos(config_.hotkey.combos)), triggers_, verbose_);
        if (!keyboard_->start()) {
            std::println(stderr, "Warning: hotkey disabled, use push-dictate-ctl instead");
            keyboard_.reset();
        }
    }

    orchestrator_.init();

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::check_correction_model() {
    const auto& model = config_.correction.model;
    auto models = ollama_.list_models(StageContext{.timeout = kModelCheckTimeout});
    if (!models) {
        std::println(stderr, "Warning: Ollama at {} not reachable ({}), correction falls back to raw text",
                     ollama_.host(), models.error().message);
        return;
    }
    if (!OllamaClient::has_model(*models, model)) {
        std::println(stderr, "Warning: Ollama model '{}' not found, correction falls back to raw text. "
                             "Pull it with: ollama pull {}", model, model);
        return;
    }
    log("Ollama model ready: " + model);
}

bool LinuxEventLoop::setup_fds() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);
    ::signal(SIGPIPE, SIG_IGN);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    trigger_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (signal_fd_ < 0 || worker_event_fd_ < 0 || trigger_event_fd_ < 0 || timer_fd_ < 0) {
        std::println(stderr, "loop: fd setup failed: {}", std::strerror(errno));
        return false;
    }

    itimerspec tick{
        .it_interval = {.tv_sec = 0, .tv_nsec = kTickNs},
        .it_value = {.tv_sec = 0, .tv_nsec = kTickNs},
    };
    if (timerfd_settime(timer_fd_, 0, &tick, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    return add_fd(signal_fd_) && add_fd(worker_event_fd_) &&
           add_fd(trigger_event_fd_) && add_fd(timer_fd_);
}

bool LinuxEventLoop::add_fd(int fd) {
    epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }
    return true;
}

int LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == timer_fd_) {
                drain_eventfd(timer_fd_);
                orchestrator_.tick();
                continue;
            }

            if (fd == trigger_event_fd_) {
                drain_eventfd(trigger_event_fd_);
                drain_triggers();
                continue;
            }

            if (fd == worker_event_fd_) {
                drain_eventfd(worker_event_fd_);
                orchestrator_.process_completions();
                continue;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0 && !add_fd(client_fd)) {
                    ipc_server_.close_client(client_fd);
                }
                continue;
            }

            on_client(fd);
        }

        if (orchestrator_.fatal()) {
            std::println(stderr, "push-dictate: input device could not be recovered, exiting");
            shutdown();
            return 1;
        }
    }

    shutdown();
    return 0;
}

void LinuxEventLoop::on_client(int fd) {
    while (true) {
        nlohmann::json cmd;
        auto status = ipc_server_.read_command(fd, cmd);
        if (status == IpcServer::ReadStatus::Partial) return;
        if (status == IpcServer::ReadStatus::Closed) {
            drop_client(fd);
            return;
        }

        // A stop answers when the session finishes; register first because
        // the session may finish inside handle().
        std::string name;
        if (cmd.is_object() && cmd.contains("cmd") && cmd["cmd"].is_string()) {
            name = cmd["cmd"].get<std::string>();
        }
        bool waits = name == "stop" ||
                     (name == "toggle" && orchestrator_.state() == SessionState::Recording);
        if (waits) waiting_clients_.push_back(fd);

        auto reply = control_.handle(cmd);
        if (waits) {
            if (reply.deferred) continue;
            std::erase(waiting_clients_, fd);
        }
        if (!ipc_server_.send_response(fd, reply.body)) {
            drop_client(fd);
            return;
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
    std::erase(waiting_clients_, fd);
}

void LinuxEventLoop::on_session_finished(const nlohmann::json& summary) {
    auto clients = std::move(waiting_clients_);
    waiting_clients_.clear();
    for (int fd : clients) {
        if (!ipc_server_.send_response(fd, summary)) {
            log(std::format("client {} went away before the result", fd));
        }
    }
}

void LinuxEventLoop::on_state_change(SessionState state) {
    bool recording = state == SessionState::Recording;
    voice_gate_.set_busy(recording);
    if (recording && speech_) speech_->interrupt();
}

void LinuxEventLoop::drain_triggers() {
    for (auto& ev : triggers_.drain()) {
        orchestrator_.on_trigger(ev);
    }
    if (auto dropped = triggers_.dropped(); dropped > 0) {
        log(std::format("{} trigger(s) dropped so far", dropped));
    }
}

void LinuxEventLoop::shutdown() {
    if (keyboard_) keyboard_->stop();
    orchestrator_.shutdown();
    if (speech_) speech_->shutdown();
    // Jobs reference the orchestrator and collaborators; finish them first.
    workers_.shutdown();
    orchestrator_.process_completions();
    ipc_server_.stop();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[push-dictate] {}", msg);
    }
}
