#pragma once

#include "audio/audio_source.hpp"
#include "config.hpp"
#include "correction/corrector.hpp"
#include "notify/notifier.hpp"
#include "output/delivery_chain.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "state_file.hpp"
#include "storage/history_store.hpp"
#include "trigger/trigger_event.hpp"
#include "trigger/trigger_merger.hpp"
#include "whisper/backend.hpp"
#include "worker_pool.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

// The dictation state machine: Idle -> Recording -> Processing -> Idle.
//
// Every method except post_completion() must be called from the event loop
// thread. Stage calls run on the executor and come back through
// post_completion(); results are tagged with the session id and a per-stage
// ticket so anything that arrives after a cancel or a timeout is dropped.
class Orchestrator {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    struct Collaborators {
        AudioSource& audio;
        WhisperBackend& transcriber;
        Corrector& corrector;
        DeliveryChain& delivery;
        HistoryStore& history;
        Notifier& notifier;
        Executor& executor;
        SettingsStore& settings;
    };

    struct TriggerResult {
        bool accepted = false;
        std::string reason;
    };

    Orchestrator(const Config& config, Collaborators collaborators,
                 bool verbose = false, ClockFn clock = Clock::now);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Opens the input stream. A failure starts the re-acquisition backoff.
    void init();

    void set_state_file(StateFile* file) { state_file_ = file; }
    // Invoked from worker threads after a completion is queued.
    void set_completion_wake(std::function<void()> wake);
    void set_state_listener(std::function<void(SessionState)> listener);
    // Invoked once per finished session with a JSON summary.
    void set_finished_listener(std::function<void(const nlohmann::json&)> listener);

    TriggerResult on_trigger(const TriggerEvent& event);
    // Aborts the open session wherever it is. Returns false when idle.
    bool cancel();
    // Periodic work: drain audio, auto-stop, stage deadlines, device health.
    void tick();
    void process_completions();
    void shutdown();

    enum class Stage { Transcribe, Correct, Deliver };

    struct Completion {
        uint64_t session_id = 0;
        uint64_t ticket = 0;
        double elapsed_ms = 0.0;
        std::variant<StageResult<TranscriptResult>,
                     StageResult<CorrectionResult>,
                     StageResult<DeliveryReport>> result;
    };

    // Thread-safe.
    void post_completion(Completion completion);

    SessionState state() const { return state_; }
    std::optional<uint64_t> session_id() const;
    std::optional<TriggerSource> session_source() const;
    const Session* active_session() const;
    double recording_duration() const;
    bool device_healthy() const { return !recovering_ && !fatal_; }
    bool fatal() const { return fatal_; }
    nlohmann::json status() const;

    static nlohmann::json summarize(const Session& session, SessionOutcome outcome);

private:
    TriggerResult start_session(const TriggerEvent& event);
    void stop_recording(StopReason reason);
    void submit_transcribe();
    void submit_correct();
    void submit_deliver();

    template <typename Work>
    void submit_stage(Stage stage, std::chrono::milliseconds timeout, Work work);

    void on_transcribed(StageResult<TranscriptResult> result, double elapsed_ms);
    void on_corrected(StageResult<CorrectionResult> result, double elapsed_ms);
    void on_delivered(StageResult<DeliveryReport> result, double elapsed_ms);
    void on_stage_timeout();

    void finish(SessionOutcome outcome, std::string error = {});
    void clear_stage();
    void set_state(SessionState state);
    void write_state_file();

    void check_device();
    void begin_recovery();
    void try_recover();
    std::chrono::milliseconds backoff_delay(uint32_t attempt) const;

    void log(const std::string& msg);

    const Config& config_;
    AudioSource& audio_;
    WhisperBackend& transcriber_;
    Corrector& corrector_;
    DeliveryChain& delivery_;
    HistoryStore& history_;
    Notifier& notifier_;
    Executor& executor_;
    SettingsStore& settings_;
    bool verbose_;
    ClockFn clock_;

    StateFile* state_file_ = nullptr;
    std::function<void(SessionState)> state_listener_;
    std::function<void(const nlohmann::json&)> finished_listener_;

    TriggerMerger merger_;
    SessionState state_ = SessionState::Idle;
    std::optional<Session> active_;
    CaptureHandle capture_;
    uint64_t next_session_id_ = 1;

    // In-flight stage
    Stage pending_stage_ = Stage::Transcribe;
    uint64_t pending_ticket_ = 0;
    uint64_t next_ticket_ = 1;
    std::stop_source stage_stop_;
    std::optional<Clock::time_point> deadline_;

    std::mutex completions_mu_;
    std::vector<Completion> completions_;
    std::function<void()> completion_wake_;

    // Device re-acquisition
    bool recovering_ = false;
    bool fatal_ = false;
    uint32_t recovery_attempt_ = 0;
    Clock::time_point next_retry_{};

    std::deque<std::string> recent_;
    uint64_t sessions_finished_ = 0;
};
