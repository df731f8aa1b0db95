#include "orchestrator.hpp"

#include "audio/silence_detector.hpp"
#include "pipeline/text_rules.hpp"

#include <algorithm>
#include <format>
#include <print>

namespace {

constexpr size_t kRecentLimit = 20;
constexpr std::chrono::milliseconds kDeliverTimeout{10000};

double elapsed_ms(Orchestrator::Clock::time_point from, Orchestrator::Clock::time_point to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

HistoryRecord make_record(const Session& s, SessionOutcome outcome) {
    double processing_s = (s.latencies.transcribe_ms + s.latencies.correct_ms) / 1000.0;
    return HistoryRecord{
        .session_id = s.id,
        .trigger = std::string(to_string(s.trigger_kind)),
        .outcome = std::string(to_string(outcome)),
        .stop_reason = std::string(to_string(s.stop_reason)),
        .output_mode = std::string(to_string(s.output_mode)),
        .transcript = s.raw_text,
        .corrected_text = s.corrected_text,
        .final_text = s.final_text,
        .delivered_text = s.delivered_text,
        .correction_failed = s.correction_failed,
        .error = s.error,
        .delivery_backend = s.delivery_backend,
        .transcribe_ms = s.latencies.transcribe_ms,
        .correct_ms = s.latencies.correct_ms,
        .deliver_ms = s.latencies.deliver_ms,
        .total_ms = s.latencies.total_ms,
        .audio_duration_s = s.audio_duration_s,
        .char_count = static_cast<int64_t>(s.final_text.size()),
        .word_count = static_cast<int64_t>(text::word_count(s.final_text)),
        .speed_ratio = processing_s > 0.0 ? s.audio_duration_s / processing_s : 0.0,
    };
}

} // namespace

Orchestrator::Orchestrator(const Config& config, Collaborators c, bool verbose, ClockFn clock)
    : config_(config),
      audio_(c.audio), transcriber_(c.transcriber), corrector_(c.corrector),
      delivery_(c.delivery), history_(c.history), notifier_(c.notifier),
      executor_(c.executor), settings_(c.settings),
      verbose_(verbose), clock_(std::move(clock)),
      merger_(std::chrono::milliseconds(config.wakeword.debounce_ms)) {}

Orchestrator::~Orchestrator() = default;

void Orchestrator::init() {
    if (!audio_.start()) {
        std::println(stderr, "orchestrator: failed to open input device, retrying");
        begin_recovery();
    }
    write_state_file();
}

void Orchestrator::set_completion_wake(std::function<void()> wake) {
    std::lock_guard lock(completions_mu_);
    completion_wake_ = std::move(wake);
}

void Orchestrator::set_state_listener(std::function<void(SessionState)> listener) {
    state_listener_ = std::move(listener);
}

void Orchestrator::set_finished_listener(std::function<void(const nlohmann::json&)> listener) {
    finished_listener_ = std::move(listener);
}

// --- Triggers ---

Orchestrator::TriggerResult Orchestrator::on_trigger(const TriggerEvent& event) {
    auto decision = merger_.resolve(event, state_, session_source());
    if (decision != TriggerMerger::Decision::Accept) {
        log(std::format("{} from {} ignored: {}",
                        event.type == TriggerEvent::Type::Start ? "start" : "stop",
                        to_string(event.source), to_string(decision)));
        return {false, std::string(to_string(decision))};
    }

    if (event.type == TriggerEvent::Type::Start) {
        auto result = start_session(event);
        if (result.accepted) merger_.commit(event);
        return result;
    }

    StopReason reason = StopReason::Trigger;
    if (event.source == TriggerSource::Silence) reason = StopReason::Silence;
    if (event.source == TriggerSource::MaxDuration) reason = StopReason::MaxDuration;
    stop_recording(reason);
    return {true, {}};
}

Orchestrator::TriggerResult Orchestrator::start_session(const TriggerEvent& event) {
    if (recovering_ || fatal_ || !audio_.healthy()) {
        std::println(stderr, "orchestrator: input device unavailable, start ignored");
        return {false, "input device unavailable"};
    }

    capture_ = audio_.begin_capture();
    if (!capture_) {
        return {false, "capture already open"};
    }

    Session s;
    s.id = next_session_id_++;
    s.trigger_kind = event.kind();
    s.trigger_source = event.source;
    s.start_time = clock_();
    s.wall_start = std::chrono::system_clock::now();
    s.settings = settings_.snapshot();
    s.output_mode = s.settings->output_mode;
    active_ = std::move(s);

    log(std::format("session {} recording ({})", active_->id, to_string(event.source)));
    set_state(SessionState::Recording);

    if (config_.feedback.notifications) {
        NotifyPayload payload{
            .session_id = active_->id,
            .text = {},
            .detail = std::string(to_string(active_->trigger_kind)),
        };
        executor_.submit([&notifier = notifier_, payload] {
            notifier.notify(NotifyEvent::SessionStarted, payload);
        });
    }
    return {true, {}};
}

void Orchestrator::stop_recording(StopReason reason) {
    audio_.pump();
    double captured = audio_.captured_seconds();
    auto samples = audio_.end_capture(capture_);
    capture_ = {};

    auto& s = *active_;
    s.end_time = clock_();
    s.stop_reason = reason;
    // Pre-roll is sent to the transcriber but not counted as recorded time.
    s.audio_duration_s = captured;

    log(std::format("session {} stopped ({}), {:.1f}s audio",
                    s.id, to_string(reason), s.audio_duration_s));
    set_state(SessionState::Processing);

    if (s.audio_duration_s < config_.silence.min_audio_seconds) {
        finish(SessionOutcome::NoSpeech, "recording too short");
        return;
    }
    if (silence::rms(samples) < config_.silence.threshold) {
        finish(SessionOutcome::NoSpeech, "no speech detected");
        return;
    }

    s.audio = std::make_shared<const std::vector<float>>(std::move(samples));
    submit_transcribe();
}

bool Orchestrator::cancel() {
    if (!active_) return false;

    if (state_ == SessionState::Recording) {
        // The buffer is discarded; nothing was sent anywhere yet.
        audio_.end_capture(capture_);
        capture_ = {};
        active_->end_time = clock_();
        active_->stop_reason = StopReason::Cancelled;
    } else {
        stage_stop_.request_stop();
    }

    log(std::format("session {} cancelled", active_->id));
    finish(SessionOutcome::Cancelled, "cancelled");
    return true;
}

// --- Stages ---

template <typename Work>
void Orchestrator::submit_stage(Stage stage, std::chrono::milliseconds timeout, Work work) {
    stage_stop_ = std::stop_source{};
    pending_stage_ = stage;
    pending_ticket_ = next_ticket_++;
    deadline_ = timeout.count() > 0 ? std::optional(clock_() + timeout) : std::nullopt;

    StageContext ctx{.stop = stage_stop_.get_token(), .timeout = timeout};
    executor_.submit([this, sid = active_->id, ticket = pending_ticket_, ctx,
                      work = std::move(work)]() mutable {
        auto started = Clock::now();
        Completion c{.session_id = sid, .ticket = ticket};
        c.result = work(ctx);
        c.elapsed_ms = elapsed_ms(started, Clock::now());
        post_completion(std::move(c));
    });
}

void Orchestrator::submit_transcribe() {
    auto audio = active_->audio;
    auto settings = active_->settings;
    uint32_t rate = audio_.sample_rate();
    submit_stage(Stage::Transcribe, std::chrono::milliseconds(config_.backend.timeout_ms),
                 [&backend = transcriber_, audio, settings, rate](const StageContext& ctx) {
                     return backend.transcribe(*audio, rate, settings->vocabulary, ctx);
                 });
}

void Orchestrator::submit_correct() {
    auto raw = active_->raw_text;
    auto settings = active_->settings;
    submit_stage(Stage::Correct, std::chrono::milliseconds(config_.correction.timeout_ms),
                 [&corrector = corrector_, raw, settings](const StageContext& ctx) {
                     return corrector.correct(raw, settings->corrections, ctx);
                 });
}

void Orchestrator::submit_deliver() {
    auto& s = *active_;
    s.final_text = text::select_final(s.raw_text, s.corrected_text,
                                      s.correction_ran && !s.correction_failed);
    s.delivered_text = text::format_delivery(s.output_mode, s.raw_text, s.final_text);

    submit_stage(Stage::Deliver, kDeliverTimeout,
                 [&delivery = delivery_, text = s.delivered_text](const StageContext& ctx) {
                     return delivery.deliver(text, ctx);
                 });
}

void Orchestrator::post_completion(Completion completion) {
    std::function<void()> wake;
    {
        std::lock_guard lock(completions_mu_);
        completions_.push_back(std::move(completion));
        wake = completion_wake_;
    }
    if (wake) wake();
}

void Orchestrator::process_completions() {
    std::vector<Completion> batch;
    {
        std::lock_guard lock(completions_mu_);
        batch.swap(completions_);
    }

    for (auto& c : batch) {
        if (!active_ || state_ != SessionState::Processing ||
            c.session_id != active_->id || c.ticket != pending_ticket_) {
            log(std::format("discarding stale result for session {}", c.session_id));
            continue;
        }
        clear_stage();

        if (auto* r = std::get_if<StageResult<TranscriptResult>>(&c.result)) {
            on_transcribed(std::move(*r), c.elapsed_ms);
        } else if (auto* r = std::get_if<StageResult<CorrectionResult>>(&c.result)) {
            on_corrected(std::move(*r), c.elapsed_ms);
        } else if (auto* r = std::get_if<StageResult<DeliveryReport>>(&c.result)) {
            on_delivered(std::move(*r), c.elapsed_ms);
        }
    }
}

void Orchestrator::on_transcribed(StageResult<TranscriptResult> result, double ms) {
    auto& s = *active_;
    s.latencies.transcribe_ms = ms;

    if (!result) {
        std::println(stderr, "orchestrator: transcription {}: {}",
                     to_string(result.error().kind), result.error().message);
        finish(SessionOutcome::Failed, "transcription " +
               std::string(to_string(result.error().kind)) + ": " + result.error().message);
        return;
    }

    s.transcript = text::trim(result->text);
    if (s.transcript.empty() || text::is_hallucination(s.transcript)) {
        log(std::format("session {}: no speech in transcript '{}'", s.id, s.transcript));
        finish(SessionOutcome::NoSpeech, "no speech detected");
        return;
    }

    s.raw_text = text::apply_corrections(s.transcript, s.settings->corrections);
    log(std::format("session {} transcribed in {:.0f} ms: {}", s.id, ms, s.raw_text));

    if (s.settings->correction_enabled && s.output_mode != OutputMode::RawOnly) {
        submit_correct();
    } else {
        submit_deliver();
    }
}

void Orchestrator::on_corrected(StageResult<CorrectionResult> result, double ms) {
    auto& s = *active_;
    s.latencies.correct_ms = ms;
    s.correction_ran = true;

    if (!result || text::trim(result->text).empty()) {
        std::string why = result ? "empty output" : result.error().message;
        std::println(stderr, "orchestrator: correction failed, using raw text: {}", why);
        s.correction_failed = true;
        s.error = "correction: " + why;
    } else {
        s.corrected_text = text::trim(result->text);
        log(std::format("session {} corrected in {:.0f} ms", s.id, ms));
    }
    submit_deliver();
}

void Orchestrator::on_delivered(StageResult<DeliveryReport> result, double ms) {
    auto& s = *active_;
    s.latencies.deliver_ms = ms;

    if (!result) {
        std::println(stderr, "orchestrator: delivery failed: {}", result.error().message);
        finish(SessionOutcome::DeliveryFailed, result.error().message);
        return;
    }

    s.delivery_backend = result->backend;
    for (auto& f : result->failures) log("delivery fallback: " + f);
    finish(s.correction_failed ? SessionOutcome::CorrectionFallback : SessionOutcome::Completed);
}

void Orchestrator::on_stage_timeout() {
    auto stage = pending_stage_;
    stage_stop_.request_stop();
    clear_stage();

    switch (stage) {
        case Stage::Transcribe:
            on_transcribed(std::unexpected(StageError::timeout("no result within deadline")),
                           static_cast<double>(config_.backend.timeout_ms));
            break;
        case Stage::Correct:
            on_corrected(std::unexpected(StageError::timeout("timed out")),
                         static_cast<double>(config_.correction.timeout_ms));
            break;
        case Stage::Deliver:
            on_delivered(std::unexpected(StageError::timeout("delivery timed out")),
                         static_cast<double>(kDeliverTimeout.count()));
            break;
    }
}

void Orchestrator::clear_stage() {
    pending_ticket_ = 0;
    deadline_.reset();
}

// --- Periodic work ---

void Orchestrator::tick() {
    if (fatal_) return;

    if (recovering_) {
        try_recover();
        return;
    }

    audio_.pump();
    check_device();
    if (recovering_) return;

    auto now = clock_();

    if (state_ == SessionState::Recording) {
        auto& s = *active_;
        double ceiling = s.trigger_kind == TriggerKind::WakeWord
            ? config_.silence.max_recording_duration
            : static_cast<double>(config_.audio.max_seconds);

        if (audio_.captured_seconds() >= ceiling) {
            log(std::format("session {} hit the {:.0f}s ceiling", s.id, ceiling));
            on_trigger(TriggerEvent::stop(TriggerSource::MaxDuration, now));
            return;
        }

        if (s.trigger_kind == TriggerKind::WakeWord) {
            double frame_s = audio_.frame_seconds();
            auto levels = audio_.recent_levels(
                silence::window_frames(frame_s, config_.silence.duration));
            if (silence::is_silent(levels, frame_s, config_.silence.threshold,
                                   config_.silence.duration)) {
                on_trigger(TriggerEvent::stop(TriggerSource::Silence, now));
            }
        }
        return;
    }

    if (state_ == SessionState::Processing && deadline_ && now >= *deadline_) {
        std::println(stderr, "orchestrator: session {} stage deadline exceeded", active_->id);
        on_stage_timeout();
    }
}

void Orchestrator::check_device() {
    if (audio_.healthy()) return;

    std::println(stderr, "orchestrator: input device lost");
    if (active_) {
        if (state_ == SessionState::Recording) {
            audio_.end_capture(capture_);
            capture_ = {};
            active_->end_time = clock_();
        } else {
            stage_stop_.request_stop();
        }
        active_->stop_reason = StopReason::DeviceLost;
        finish(SessionOutcome::Aborted, "input device lost");
    }
    begin_recovery();
}

void Orchestrator::begin_recovery() {
    recovering_ = true;
    recovery_attempt_ = 0;
    next_retry_ = clock_() + backoff_delay(0);
    write_state_file();
}

void Orchestrator::try_recover() {
    auto now = clock_();
    if (now < next_retry_) return;

    if (audio_.restart() && audio_.healthy()) {
        std::println(stderr, "orchestrator: input device re-acquired after {} attempt(s)",
                     recovery_attempt_ + 1);
        recovering_ = false;
        recovery_attempt_ = 0;
        write_state_file();
        return;
    }

    ++recovery_attempt_;
    if (recovery_attempt_ >= config_.device.max_retries) {
        std::println(stderr, "orchestrator: input device unavailable after {} attempts, giving up",
                     recovery_attempt_);
        fatal_ = true;
        write_state_file();
        return;
    }
    next_retry_ = now + backoff_delay(recovery_attempt_);
    log(std::format("device retry {} failed", recovery_attempt_));
}

std::chrono::milliseconds Orchestrator::backoff_delay(uint32_t attempt) const {
    uint64_t delay = config_.device.retry_base_ms;
    for (uint32_t i = 0; i < attempt && delay < config_.device.retry_max_ms; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<uint64_t>(delay, config_.device.retry_max_ms));
}

// --- Completion ---

void Orchestrator::finish(SessionOutcome outcome, std::string error) {
    auto& s = *active_;
    auto now = clock_();
    if (!error.empty() && outcome != SessionOutcome::CorrectionFallback) s.error = std::move(error);
    if (s.end_time != Clock::time_point{}) s.latencies.total_ms = elapsed_ms(s.end_time, now);

    log(std::format("session {} finished: {}", s.id, to_string(outcome)));

    auto record = make_record(s, outcome);
    bool notify = config_.feedback.notifications;
    NotifyPayload payload{
        .session_id = s.id,
        .text = is_success(outcome) ? s.delivered_text : s.error,
        .detail = std::string(to_string(outcome)),
    };
    auto event = is_success(outcome) ? NotifyEvent::SessionCompleted : NotifyEvent::SessionFailed;

    executor_.submit([&history = history_, &notifier = notifier_, record, payload, event, notify] {
        if (!history.append(record)) {
            std::println(stderr, "orchestrator: failed to archive session {}", record.session_id);
        }
        if (notify) notifier.notify(event, payload);
    });

    if (is_success(outcome) && !s.final_text.empty()) {
        recent_.push_front(s.final_text);
        if (recent_.size() > kRecentLimit) recent_.pop_back();
    }
    ++sessions_finished_;

    auto summary = summarize(s, outcome);
    active_.reset();
    clear_stage();
    set_state(SessionState::Idle);

    if (finished_listener_) finished_listener_(summary);
}

void Orchestrator::shutdown() {
    if (active_) cancel();
    audio_.stop();
}

// --- State ---

void Orchestrator::set_state(SessionState state) {
    state_ = state;
    write_state_file();
    if (state_listener_) state_listener_(state);
}

void Orchestrator::write_state_file() {
    if (!state_file_) return;

    auto settings = settings_.snapshot();
    nlohmann::json j = {
        {"state", to_string(state_)},
        {"device", fatal_ ? "failed" : (recovering_ ? "recovering" : "ok")},
        {"output_mode", to_string(settings->output_mode)},
        {"correction_enabled", settings->correction_enabled},
        {"recent_transcriptions", recent_},
        {"updated_at", std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch()).count()},
    };
    if (active_) {
        j["session_id"] = active_->id;
        j["trigger"] = to_string(active_->trigger_kind);
    }

    if (auto r = state_file_->write(j); !r) {
        std::println(stderr, "orchestrator: {}", r.error());
    }
}

std::optional<uint64_t> Orchestrator::session_id() const {
    if (!active_) return std::nullopt;
    return active_->id;
}

std::optional<TriggerSource> Orchestrator::session_source() const {
    if (!active_) return std::nullopt;
    return active_->trigger_source;
}

const Session* Orchestrator::active_session() const {
    return active_ ? &*active_ : nullptr;
}

double Orchestrator::recording_duration() const {
    return state_ == SessionState::Recording ? audio_.captured_seconds() : 0.0;
}

nlohmann::json Orchestrator::status() const {
    auto settings = settings_.snapshot();
    nlohmann::json resp = {
        {"status", "ok"},
        {"state", to_string(state_)},
        {"device", fatal_ ? "failed" : (recovering_ ? "recovering" : "ok")},
        {"level", audio_.input_level()},
        {"output_mode", to_string(settings->output_mode)},
        {"correction_enabled", settings->correction_enabled},
        {"settings_version", settings->version},
        {"vocabulary_size", settings->vocabulary.size()},
        {"corrections_size", settings->corrections.size()},
        {"sessions_finished", sessions_finished_},
    };
    if (active_) {
        resp["session_id"] = active_->id;
        resp["trigger"] = to_string(active_->trigger_kind);
        if (state_ == SessionState::Recording) resp["duration"] = recording_duration();
    }
    return resp;
}

nlohmann::json Orchestrator::summarize(const Session& s, SessionOutcome outcome) {
    nlohmann::json j = {
        {"status", is_success(outcome) ? "ok" : "error"},
        {"session_id", s.id},
        {"outcome", to_string(outcome)},
        {"trigger", to_string(s.trigger_kind)},
        {"stop_reason", to_string(s.stop_reason)},
        {"duration", s.audio_duration_s},
        {"latency_ms", {
            {"transcribe", s.latencies.transcribe_ms},
            {"correct", s.latencies.correct_ms},
            {"deliver", s.latencies.deliver_ms},
            {"total", s.latencies.total_ms},
        }},
    };
    if (is_success(outcome)) {
        j["text"] = s.delivered_text;
        j["raw_text"] = s.raw_text;
        j["backend"] = s.delivery_backend;
        if (s.correction_failed) j["correction_failed"] = true;
    } else {
        j["message"] = s.error;
    }
    return j;
}

void Orchestrator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[push-dictate] {}", msg);
    }
}
