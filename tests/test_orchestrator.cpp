#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "orchestrator_harness.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("Orchestrator hotkey session", "[orchestrator]") {
    Harness h;

    SECTION("ChordPressRecordsAndDelivers") {
        h.write(h.cfg.audio.preroll_samples(), 0.1f);
        REQUIRE(h.start(TriggerSource::Chord).accepted);
        REQUIRE(h.orch.state() == SessionState::Recording);

        h.feed(20, 0.1f);
        REQUIRE(h.orch.recording_duration() == Catch::Approx(2.0));

        REQUIRE(h.stop(TriggerSource::Chord).accepted);
        REQUIRE(h.orch.state() == SessionState::Processing);

        h.settle();
        REQUIRE(h.orch.state() == SessionState::Idle);

        REQUIRE(h.transcriber.calls == 1);
        REQUIRE(h.transcriber.samples == 40000);
        REQUIRE(h.corrector.calls == 0);
        REQUIRE(h.output->delivered == std::vector<std::string>{"hello world"});

        REQUIRE(h.history.records.size() == 1);
        auto& rec = h.history.records[0];
        REQUIRE(rec.outcome == "completed");
        REQUIRE(rec.trigger == "manual");
        REQUIRE(rec.stop_reason == "trigger");
        REQUIRE(rec.final_text == "hello world");
        REQUIRE(rec.delivered_text == "hello world");
        REQUIRE(rec.delivery_backend == "fake");
        REQUIRE(rec.audio_duration_s == Catch::Approx(2.0));
        REQUIRE(rec.word_count == 2);
        REQUIRE(rec.char_count == 11);

        REQUIRE(h.finished.size() == 1);
        REQUIRE(h.finished[0]["status"] == "ok");
        REQUIRE(h.finished[0]["text"] == "hello world");
    }

    SECTION("OneArchiveAndOneOutcomeNotificationPerSession") {
        h.record_chord();
        h.settle();

        REQUIRE(h.history.records.size() == 1);
        REQUIRE(h.notifier.count(NotifyEvent::SessionStarted) == 1);
        REQUIRE(h.notifier.count(NotifyEvent::SessionCompleted) == 1);
        REQUIRE(h.notifier.count(NotifyEvent::SessionFailed) == 0);
    }

    SECTION("VocabularyIsPassedToTranscriber") {
        h.settings.update([](Settings& s) { s.vocabulary = {"Kubernetes", "PipeWire"}; });
        h.record_chord();
        h.settle();
        REQUIRE(h.transcriber.last_vocabulary == std::vector<std::string>{"Kubernetes", "PipeWire"});
    }

    SECTION("DictionaryAppliedBeforeDelivery") {
        h.settings.update([](Settings& s) { s.corrections = {{"wurld", "world"}}; });
        h.transcriber.text = "hello wurld";
        h.record_chord();
        h.settle();
        REQUIRE(h.output->delivered == std::vector<std::string>{"hello world"});
        REQUIRE(h.history.records[0].transcript == "hello world");
    }

    SECTION("ChordStopIgnoredForWakeSession") {
        REQUIRE(h.start(TriggerSource::WakeWord).accepted);
        auto res = h.stop(TriggerSource::Chord);
        REQUIRE_FALSE(res.accepted);
        REQUIRE(h.orch.state() == SessionState::Recording);
    }
}

TEST_CASE("Orchestrator correction stage", "[orchestrator]") {
    Config cfg = test_config();
    cfg.correction.enabled = true;
    cfg.correction.timeout_ms = 3000;
    Harness h(cfg);

    SECTION("CorrectedTextIsDelivered") {
        h.corrector.text = "Hello, world.";
        h.record_chord();
        h.settle();

        REQUIRE(h.corrector.calls == 1);
        REQUIRE(h.corrector.last_input == "hello world");
        REQUIRE(h.output->delivered == std::vector<std::string>{"Hello, world."});
        REQUIRE(h.history.records[0].outcome == "completed");
        REQUIRE(h.history.records[0].corrected_text == "Hello, world.");
    }

    SECTION("BothModeShowsRawAlongside") {
        h.settings.update([](Settings& s) { s.output_mode = OutputMode::Both; });
        h.corrector.text = "Hello, world.";
        h.record_chord();
        h.settle();
        REQUIRE(h.output->delivered == std::vector<std::string>{"Hello, world. [hello world]"});
    }

    SECTION("RawModeSkipsCorrection") {
        h.settings.update([](Settings& s) { s.output_mode = OutputMode::RawOnly; });
        h.record_chord();
        h.settle();
        REQUIRE(h.corrector.calls == 0);
        REQUIRE(h.output->delivered == std::vector<std::string>{"hello world"});
    }

    SECTION("CorrectorErrorFallsBackToRaw") {
        h.corrector.error = StageError::failure("connection refused");
        h.record_chord();
        h.settle();

        REQUIRE(h.output->delivered == std::vector<std::string>{"hello world"});
        auto& rec = h.history.records[0];
        REQUIRE(rec.outcome == "correction_fallback");
        REQUIRE(rec.correction_failed);
        REQUIRE(rec.error == "correction: connection refused");
        REQUIRE(h.notifier.count(NotifyEvent::SessionCompleted) == 1);
    }

    SECTION("TimeoutDiscardsLateCorrection") {
        h.corrector.text = "Too late.";
        h.record_chord();

        // Run the transcription only; the correction job stays queued.
        h.executor.run_all();
        h.orch.process_completions();
        REQUIRE(h.orch.state() == SessionState::Processing);
        REQUIRE(h.executor.pending() == 1);

        h.clock.advance(2999ms);
        h.orch.tick();
        REQUIRE(h.executor.pending() == 1);

        h.clock.advance(1ms);
        h.orch.tick();

        // The late correction and the delivery both run now.
        h.settle();
        REQUIRE(h.orch.state() == SessionState::Idle);
        REQUIRE(h.output->delivered == std::vector<std::string>{"hello world"});
        auto& rec = h.history.records.at(0);
        REQUIRE(rec.outcome == "correction_fallback");
        REQUIRE(rec.correction_failed);
        REQUIRE(rec.corrected_text.empty());
        REQUIRE(h.history.records.size() == 1);
    }
}

TEST_CASE("Orchestrator wake-word session", "[orchestrator]") {
    Harness h;

    SECTION("SilenceEndsSessionAfterConfiguredDuration") {
        h.write(h.cfg.audio.preroll_samples(), 0.0f);
        REQUIRE(h.start(TriggerSource::WakeWord).accepted);

        h.feed(14, 0.0f);
        REQUIRE(h.orch.state() == SessionState::Recording);

        h.feed(1, 0.0f);
        REQUIRE(h.orch.state() != SessionState::Recording);

        h.settle();
        REQUIRE(h.transcriber.calls == 0);
        REQUIRE(h.history.records.size() == 1);
        auto& rec = h.history.records[0];
        REQUIRE(rec.trigger == "wake_word");
        REQUIRE(rec.stop_reason == "silence");
        REQUIRE(rec.outcome == "no_speech");
        REQUIRE(rec.audio_duration_s == Catch::Approx(1.5));
    }

    SECTION("SpeechKeepsSessionOpen") {
        REQUIRE(h.start(TriggerSource::WakeWord).accepted);
        h.feed(10, 0.1f);
        h.feed(10, 0.0f);
        REQUIRE(h.orch.state() == SessionState::Recording);
        h.feed(5, 0.0f);
        REQUIRE(h.orch.state() == SessionState::Processing);

        h.settle();
        REQUIRE(h.history.records[0].outcome == "completed");
        REQUIRE(h.history.records[0].stop_reason == "silence");
    }

    SECTION("ControlStopEndsWakeSession") {
        REQUIRE(h.start(TriggerSource::WakeWord).accepted);
        h.feed(10, 0.1f);
        REQUIRE(h.stop(TriggerSource::Control).accepted);
        h.settle();
        REQUIRE(h.history.records[0].stop_reason == "trigger");
    }
}

TEST_CASE("Orchestrator duration ceilings", "[orchestrator]") {
    SECTION("ManualSessionStopsAtMaxSeconds") {
        Config cfg = test_config();
        cfg.audio.max_seconds = 1;
        Harness h(cfg);

        REQUIRE(h.start(TriggerSource::Control).accepted);
        h.feed(9, 0.1f);
        REQUIRE(h.orch.state() == SessionState::Recording);
        h.feed(1, 0.1f);
        REQUIRE(h.orch.state() == SessionState::Processing);

        h.settle();
        REQUIRE(h.history.records[0].stop_reason == "max_duration");
        REQUIRE(h.history.records[0].outcome == "completed");
    }

    SECTION("WakeSessionStopsAtMaxRecordingDuration") {
        Config cfg = test_config();
        cfg.silence.max_recording_duration = 2.0;
        Harness h(cfg);

        REQUIRE(h.start(TriggerSource::WakeWord).accepted);
        h.feed(19, 0.1f);
        REQUIRE(h.orch.state() == SessionState::Recording);
        h.feed(1, 0.1f);
        REQUIRE(h.orch.state() == SessionState::Processing);

        h.settle();
        REQUIRE(h.history.records[0].stop_reason == "max_duration");
    }
}

TEST_CASE("Orchestrator no-speech outcomes", "[orchestrator]") {
    Harness h;

    SECTION("TooShortRecording") {
        REQUIRE(h.start(TriggerSource::Chord).accepted);
        h.feed(2, 0.1f);
        REQUIRE(h.stop(TriggerSource::Chord).accepted);
        REQUIRE(h.orch.state() == SessionState::Idle);

        h.settle();
        REQUIRE(h.transcriber.calls == 0);
        REQUIRE(h.history.records[0].outcome == "no_speech");
        REQUIRE(h.history.records[0].error == "recording too short");
        REQUIRE(h.output->delivered.empty());
    }

    SECTION("SilentRecording") {
        REQUIRE(h.start(TriggerSource::Chord).accepted);
        h.feed(10, 0.001f);
        REQUIRE(h.stop(TriggerSource::Chord).accepted);
        h.settle();
        REQUIRE(h.transcriber.calls == 0);
        REQUIRE(h.history.records[0].error == "no speech detected");
    }

    SECTION("EmptyTranscript") {
        h.transcriber.text = "   ";
        h.record_chord();
        h.settle();
        REQUIRE(h.history.records[0].outcome == "no_speech");
        REQUIRE(h.output->delivered.empty());
        REQUIRE(h.notifier.count(NotifyEvent::SessionFailed) == 1);
    }

    SECTION("HallucinatedTranscript") {
        h.transcriber.text = "Thank you.";
        h.record_chord();
        h.settle();
        REQUIRE(h.history.records[0].outcome == "no_speech");
        REQUIRE(h.output->delivered.empty());
    }
}

TEST_CASE("Orchestrator stage failures", "[orchestrator]") {
    SECTION("TranscriptionError") {
        Harness h;
        h.transcriber.error = StageError::failure("connection refused");
        h.record_chord();
        h.settle();

        REQUIRE(h.orch.state() == SessionState::Idle);
        auto& rec = h.history.records[0];
        REQUIRE(rec.outcome == "failed");
        REQUIRE(rec.error == "transcription failure: connection refused");
        REQUIRE(h.output->delivered.empty());
        REQUIRE(h.finished[0]["status"] == "error");
    }

    SECTION("TranscriptionTimeout") {
        Config cfg = test_config();
        cfg.backend.timeout_ms = 5000;
        Harness h(cfg);
        h.record_chord();

        h.clock.advance(5000ms);
        h.orch.tick();
        REQUIRE(h.orch.state() == SessionState::Idle);

        h.settle();
        REQUIRE(h.history.records.size() == 1);
        REQUIRE(h.history.records[0].outcome == "failed");
        REQUIRE(h.output->delivered.empty());
    }

    SECTION("AllOutputsFail") {
        Harness h(test_config(), true);
        h.record_chord();
        h.settle();
        REQUIRE(h.history.records[0].outcome == "delivery_failed");
        REQUIRE(h.notifier.count(NotifyEvent::SessionFailed) == 1);
    }
}

TEST_CASE("Orchestrator cancel", "[orchestrator]") {
    Harness h;

    SECTION("CancelWhileIdle") {
        REQUIRE_FALSE(h.orch.cancel());
        REQUIRE(h.history.records.empty());
    }

    SECTION("CancelWhileRecording") {
        REQUIRE(h.start(TriggerSource::Chord).accepted);
        h.feed(10, 0.1f);
        REQUIRE(h.orch.cancel());
        REQUIRE(h.orch.state() == SessionState::Idle);
        REQUIRE_FALSE(h.audio.capturing());

        h.settle();
        REQUIRE(h.transcriber.calls == 0);
        REQUIRE(h.history.records[0].outcome == "cancelled");
        REQUIRE(h.history.records[0].stop_reason == "cancelled");
    }

    SECTION("CancelMidTranscribeDiscardsLateResult") {
        h.record_chord();
        REQUIRE(h.orch.state() == SessionState::Processing);
        REQUIRE(h.orch.cancel());
        REQUIRE(h.orch.state() == SessionState::Idle);

        h.settle();
        REQUIRE(h.transcriber.calls == 1);
        REQUIRE(h.transcriber.saw_stop);
        REQUIRE(h.output->delivered.empty());
        REQUIRE(h.history.records.size() == 1);
        REQUIRE(h.history.records[0].outcome == "cancelled");
    }

    SECTION("LateResultDoesNotLeakIntoNextSession") {
        h.transcriber.text = "first session";
        h.record_chord();
        REQUIRE(h.orch.cancel());

        h.clock.advance(1s);
        h.record_chord();
        REQUIRE(h.orch.state() == SessionState::Processing);

        // Both transcriptions return "second session" now; only the second
        // session's ticket may advance the pipeline.
        h.transcriber.text = "second session";
        h.settle();

        REQUIRE(h.output->delivered == std::vector<std::string>{"second session"});
        REQUIRE(h.history.records.size() == 2);
        REQUIRE(h.history.records[0].outcome == "cancelled");
        REQUIRE(h.history.records[1].outcome == "completed");
    }
}

TEST_CASE("Orchestrator delivery interruption", "[orchestrator]") {
    Config cfg = test_config();
    cfg.feedback.notifications = false;
    Harness h(cfg);
    h.record_chord();
    // Transcribe, then leave the Deliver job queued.
    h.executor.run_all();
    h.orch.process_completions();
    REQUIRE(h.orch.state() == SessionState::Processing);
    REQUIRE(h.executor.pending() > 0);
    h.output->hang = true;

    SECTION("CancelStopsRunningOutput") {
        std::jthread runner([&h] { h.executor.run_all(); });
        std::this_thread::sleep_for(20ms);
        REQUIRE(h.orch.cancel());
        runner.join();

        h.settle();
        REQUIRE(h.output->delivered.empty());
        REQUIRE(h.history.records.size() == 1);
        REQUIRE(h.history.records[0].outcome == "cancelled");
    }

    SECTION("DeadlineStopsRunningOutput") {
        std::jthread runner([&h] { h.executor.run_all(); });
        h.clock.advance(10s);
        h.orch.tick();
        runner.join();

        h.settle();
        REQUIRE(h.output->delivered.empty());
        REQUIRE(h.history.records.size() == 1);
        REQUIRE(h.history.records[0].outcome == "delivery_failed");
    }
}

TEST_CASE("Orchestrator mutual exclusion", "[orchestrator]") {
    Harness h;

    SECTION("StartsIgnoredWhileRecording") {
        REQUIRE(h.start(TriggerSource::Chord).accepted);
        auto id = h.orch.session_id();

        h.clock.advance(1s);
        REQUIRE_FALSE(h.start(TriggerSource::WakeWord).accepted);
        REQUIRE_FALSE(h.start(TriggerSource::Control).accepted);
        REQUIRE(h.orch.session_id() == id);
    }

    SECTION("StartsAndStopsIgnoredWhileProcessing") {
        h.record_chord();
        REQUIRE(h.orch.state() == SessionState::Processing);

        auto res = h.start(TriggerSource::Chord);
        REQUIRE_FALSE(res.accepted);
        REQUIRE(res.reason == "busy");
        REQUIRE_FALSE(h.stop(TriggerSource::Control).accepted);
        REQUIRE(h.orch.state() == SessionState::Processing);

        h.settle();
        REQUIRE(h.history.records.size() == 1);
    }

    SECTION("DuplicateStartFromOtherProducerIsDebounced") {
        REQUIRE(h.start(TriggerSource::WakeWord).accepted);
        REQUIRE(h.orch.cancel());
        h.clock.advance(100ms);
        auto res = h.start(TriggerSource::Chord);
        REQUIRE_FALSE(res.accepted);
        REQUIRE(res.reason == "duplicate start");
    }

    SECTION("StopWhileIdleIgnored") {
        REQUIRE_FALSE(h.stop(TriggerSource::Control).accepted);
        REQUIRE(h.history.records.empty());
    }
}

TEST_CASE("Orchestrator settings snapshot", "[orchestrator]") {
    Harness h;

    SECTION("MidSessionChangesApplyToNextSession") {
        h.settings.update([](Settings& s) { s.corrections = {{"helo", "hello"}}; });
        h.transcriber.text = "helo world";

        h.write(h.cfg.audio.preroll_samples(), 0.1f);
        REQUIRE(h.start(TriggerSource::Chord).accepted);
        h.settings.update([](Settings& s) {
            s.corrections.clear();
            s.correction_enabled = true;
            s.output_mode = OutputMode::Both;
        });
        h.feed(20, 0.1f);
        REQUIRE(h.stop(TriggerSource::Chord).accepted);
        h.settle();

        REQUIRE(h.corrector.calls == 0);
        REQUIRE(h.output->delivered.back() == "hello world");
        REQUIRE(h.history.records[0].output_mode == "corrected");

        h.clock.advance(1s);
        h.record_chord();
        h.settle();
        REQUIRE(h.corrector.calls == 1);
        REQUIRE(h.history.records[1].output_mode == "both");
        REQUIRE(h.output->delivered.back() == "helo world. [helo world]");
    }
}

TEST_CASE("Orchestrator device loss", "[orchestrator]") {
    Config cfg = test_config();
    cfg.device.retry_base_ms = 250;
    cfg.device.retry_max_ms = 1000;
    cfg.device.max_retries = 3;
    Harness h(cfg);

    SECTION("RecordingSessionIsAborted") {
        REQUIRE(h.start(TriggerSource::Chord).accepted);
        h.feed(5, 0.1f);

        h.capture.broken = true;
        h.orch.tick();
        REQUIRE(h.orch.state() == SessionState::Idle);
        REQUIRE_FALSE(h.orch.device_healthy());

        h.settle();
        REQUIRE(h.history.records[0].outcome == "aborted");
        REQUIRE(h.history.records[0].stop_reason == "device_lost");
        REQUIRE(h.transcriber.calls == 0);
    }

    SECTION("StartRefusedWhileRecovering") {
        h.capture.broken = true;
        h.orch.tick();
        auto res = h.start(TriggerSource::Control);
        REQUIRE_FALSE(res.accepted);
        REQUIRE(res.reason == "input device unavailable");
    }

    SECTION("RefusedStartDoesNotDebounceOtherProducer") {
        h.capture.broken = true;
        h.orch.tick();
        REQUIRE_FALSE(h.start(TriggerSource::WakeWord).accepted);

        h.clock.advance(250ms);
        h.orch.tick();
        REQUIRE(h.orch.device_healthy());
        REQUIRE(h.start(TriggerSource::Chord).accepted);
    }

    SECTION("ReacquiredAfterBackoff") {
        h.capture.broken = true;
        h.capture.start_ok = false;
        h.orch.tick();
        int starts = h.capture.starts;

        h.clock.advance(249ms);
        h.orch.tick();
        REQUIRE(h.capture.starts == starts);

        h.clock.advance(1ms);
        h.orch.tick();
        REQUIRE(h.capture.starts == starts + 1);
        REQUIRE_FALSE(h.orch.device_healthy());

        // Second retry waits twice as long.
        h.capture.start_ok = true;
        h.clock.advance(499ms);
        h.orch.tick();
        REQUIRE_FALSE(h.orch.device_healthy());
        h.clock.advance(1ms);
        h.orch.tick();
        REQUIRE(h.orch.device_healthy());

        REQUIRE(h.start(TriggerSource::Control).accepted);
    }

    SECTION("FatalAfterMaxRetries") {
        h.capture.broken = true;
        h.capture.start_ok = false;
        h.orch.tick();

        h.clock.advance(250ms);
        h.orch.tick();
        h.clock.advance(500ms);
        h.orch.tick();
        REQUIRE_FALSE(h.orch.fatal());
        h.clock.advance(1000ms);
        h.orch.tick();
        REQUIRE(h.orch.fatal());
        REQUIRE(h.orch.status()["device"] == "failed");
    }
}

TEST_CASE("Orchestrator status", "[orchestrator]") {
    Harness h;

    SECTION("IdleStatus") {
        auto s = h.orch.status();
        REQUIRE(s["state"] == "idle");
        REQUIRE(s["device"] == "ok");
        REQUIRE(s["output_mode"] == "corrected");
        REQUIRE_FALSE(s.contains("session_id"));
    }

    SECTION("RecordingStatus") {
        REQUIRE(h.start(TriggerSource::WakeWord).accepted);
        h.feed(5, 0.1f);
        auto s = h.orch.status();
        REQUIRE(s["state"] == "recording");
        REQUIRE(s["trigger"] == "wake_word");
        REQUIRE(s["duration"].get<double>() == Catch::Approx(0.5));
    }

    SECTION("StateListenerSeesTransitions") {
        std::vector<SessionState> seen;
        h.orch.set_state_listener([&](SessionState s) { seen.push_back(s); });
        h.record_chord();
        h.settle();
        REQUIRE(seen == std::vector<SessionState>{
            SessionState::Recording, SessionState::Processing, SessionState::Idle});
    }
}
