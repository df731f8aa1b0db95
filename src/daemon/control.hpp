#pragma once

#include "orchestrator.hpp"
#include "settings.hpp"
#include "speech/speech_service.hpp"
#include "storage/history_store.hpp"
#include "trigger/trigger_channel.hpp"
#include "trigger/wake_word_gate.hpp"

#include <nlohmann/json.hpp>
#include <string>

// Socket command surface. Runs on the event loop thread.
class Control {
public:
    struct Deps {
        Orchestrator& orchestrator;
        SettingsStore& settings;
        HistoryStore& history;
        TriggerChannel& triggers;
        WakeWordGate& wake_gate;
        SpeechService* speech = nullptr; // optional
    };

    struct Reply {
        nlohmann::json body;
        // The caller answers later from the session-finished notification.
        bool deferred = false;
    };

    explicit Control(Deps deps, bool verbose = false);

    Reply handle(const nlohmann::json& cmd);

    void attach_speech(SpeechService* speech) { deps_.speech = speech; }

    static nlohmann::json settings_json(const Settings& settings);

private:
    Reply handle_start();
    Reply handle_stop();
    Reply handle_toggle();
    nlohmann::json handle_cancel();
    nlohmann::json handle_wake(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_report(const nlohmann::json& cmd);
    nlohmann::json handle_set_mode(const nlohmann::json& cmd);
    nlohmann::json handle_set_correction(const nlohmann::json& cmd);
    nlohmann::json handle_teach(const nlohmann::json& cmd);
    nlohmann::json handle_add_correction(const nlohmann::json& cmd);
    nlohmann::json handle_speech(const std::string& name, const nlohmann::json& cmd);

    void log(const std::string& msg);

    Deps deps_;
    bool verbose_;
};
