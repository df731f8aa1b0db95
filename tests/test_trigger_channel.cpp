#include <catch2/catch_test_macros.hpp>

#include "trigger/trigger_channel.hpp"

#include <atomic>
#include <thread>
#include <vector>

TEST_CASE("TriggerChannel", "[trigger]") {

    SECTION("DrainPreservesOrder") {
        TriggerChannel ch(8);
        REQUIRE(ch.push(TriggerEvent::start(TriggerSource::Chord)));
        REQUIRE(ch.push(TriggerEvent::stop(TriggerSource::Chord)));

        auto events = ch.drain();
        REQUIRE(events.size() == 2);
        REQUIRE(events[0].type == TriggerEvent::Type::Start);
        REQUIRE(events[1].type == TriggerEvent::Type::Stop);
        REQUIRE(ch.drain().empty());
    }

    SECTION("FullChannelDropsAndCounts") {
        TriggerChannel ch(2);
        REQUIRE(ch.push(TriggerEvent::start(TriggerSource::Chord)));
        REQUIRE(ch.push(TriggerEvent::stop(TriggerSource::Chord)));
        REQUIRE_FALSE(ch.push(TriggerEvent::start(TriggerSource::WakeWord)));
        REQUIRE(ch.dropped() == 1);
        REQUIRE(ch.drain().size() == 2);
        REQUIRE(ch.push(TriggerEvent::start(TriggerSource::WakeWord)));
    }

    SECTION("WakeCalledPerPush") {
        int wakes = 0;
        TriggerChannel ch(1, [&] { ++wakes; });
        ch.push(TriggerEvent::start(TriggerSource::Chord));
        ch.push(TriggerEvent::start(TriggerSource::Chord));
        REQUIRE(wakes == 1);

        ch.set_wake([&] { wakes += 10; });
        ch.drain();
        ch.push(TriggerEvent::start(TriggerSource::Chord));
        REQUIRE(wakes == 11);
    }

    SECTION("ConcurrentProducers") {
        TriggerChannel ch(1000);
        std::atomic<int> accepted{0};
        std::vector<std::thread> producers;
        for (int t = 0; t < 4; ++t) {
            producers.emplace_back([&] {
                for (int i = 0; i < 100; ++i) {
                    if (ch.push(TriggerEvent::start(TriggerSource::WakeWord))) ++accepted;
                }
            });
        }
        for (auto& p : producers) p.join();
        REQUIRE(accepted == 400);
        REQUIRE(ch.drain().size() == 400);
    }
}
