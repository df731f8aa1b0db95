#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "settings.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

TEST_CASE("OutputMode names", "[settings]") {
    REQUIRE(parse_output_mode("raw") == OutputMode::RawOnly);
    REQUIRE(parse_output_mode("whisper") == OutputMode::RawOnly);
    REQUIRE(parse_output_mode("corrected") == OutputMode::CorrectedOnly);
    REQUIRE(parse_output_mode("ollama") == OutputMode::CorrectedOnly);
    REQUIRE(parse_output_mode("both") == OutputMode::Both);
    REQUIRE_FALSE(parse_output_mode("loud").has_value());
    REQUIRE(to_string(OutputMode::Both) == "both");
}

TEST_CASE("SettingsStore", "[settings]") {

    SECTION("FromConfig") {
        Config cfg;
        cfg.output.mode = "raw";
        cfg.correction.enabled = false;
        cfg.vocabulary = {"Catch2"};
        cfg.corrections = {{"cache two", "Catch2"}};

        auto s = SettingsStore::from_config(cfg);
        REQUIRE(s.output_mode == OutputMode::RawOnly);
        REQUIRE_FALSE(s.correction_enabled);
        REQUIRE(s.vocabulary == std::vector<std::string>{"Catch2"});
        REQUIRE(s.corrections.size() == 1);
    }

    SECTION("UnknownModeFallsBackToCorrected") {
        Config cfg;
        cfg.output.mode = "shout";
        REQUIRE(SettingsStore::from_config(cfg).output_mode == OutputMode::CorrectedOnly);
    }

    SECTION("UpdatePublishesNewVersion") {
        SettingsStore store;
        auto before = store.snapshot();
        REQUIRE(before->version == 0);

        auto after = store.update([](Settings& s) { s.output_mode = OutputMode::Both; });
        REQUIRE(after->version == 1);
        REQUIRE(after->output_mode == OutputMode::Both);
        REQUIRE(store.snapshot() == after);

        // Earlier snapshots are immutable.
        REQUIRE(before->version == 0);
        REQUIRE(before->output_mode == OutputMode::CorrectedOnly);
    }

    SECTION("ConcurrentUpdatesAllApply") {
        SettingsStore store;
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&store, t] {
                for (int i = 0; i < 50; ++i) {
                    store.update([&](Settings& s) {
                        s.vocabulary.push_back(std::to_string(t) + ":" + std::to_string(i));
                    });
                }
            });
        }
        for (auto& th : threads) th.join();

        auto s = store.snapshot();
        REQUIRE(s->version == 200);
        REQUIRE(s->vocabulary.size() == 200);
    }

    SECTION("PersistAndReload") {
        TmpDir dir("settings");
        auto path = dir.file("settings.json");
        {
            SettingsStore store;
            REQUIRE(store.attach(path));
            store.update([](Settings& s) {
                s.output_mode = OutputMode::RawOnly;
                s.correction_enabled = false;
                s.vocabulary = {"PipeWire"};
                s.corrections = {{"pipe wire", "PipeWire"}};
            });
        }
        REQUIRE(std::filesystem::exists(path));

        SettingsStore reloaded;
        REQUIRE(reloaded.attach(path));
        auto s = reloaded.snapshot();
        REQUIRE(s->output_mode == OutputMode::RawOnly);
        REQUIRE_FALSE(s->correction_enabled);
        REQUIRE(s->vocabulary == std::vector<std::string>{"PipeWire"});
        REQUIRE(s->corrections.at("pipe wire") == "PipeWire");
    }

    SECTION("AttachMissingFileKeepsDefaults") {
        TmpDir dir("settings_missing");
        SettingsStore store;
        REQUIRE(store.attach(dir.file("none.json")));
        REQUIRE(store.snapshot()->version == 0);
    }

    SECTION("AttachCorruptFileReportsError") {
        TmpDir dir("settings_corrupt");
        auto path = dir.file("settings.json");
        std::ofstream(path) << "{ not json";

        SettingsStore store;
        auto res = store.attach(path);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().find("parse error") != std::string::npos);
        REQUIRE(store.snapshot()->output_mode == OutputMode::CorrectedOnly);
    }
}
