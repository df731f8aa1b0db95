#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "output/delivery_chain.hpp"

#include <chrono>
#include <memory>
#include <stop_token>
#include <thread>

TEST_CASE("DeliveryChain", "[output]") {
    StageContext ctx;

    SECTION("EmptyChainFails") {
        DeliveryChain chain;
        auto res = chain.deliver("hi", ctx);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == StageError::Kind::Failure);
        REQUIRE(res.error().message == "no output methods configured");
    }

    SECTION("FirstSuccessWins") {
        auto first = std::make_unique<FakeOutput>("type");
        auto second = std::make_unique<FakeOutput>("clipboard");
        auto* first_ptr = first.get();
        auto* second_ptr = second.get();
        DeliveryChain chain;
        chain.add(std::move(first));
        chain.add(std::move(second));

        auto res = chain.deliver("hello", ctx);
        REQUIRE(res);
        REQUIRE(res->backend == "type");
        REQUIRE(res->failures.empty());
        REQUIRE(first_ptr->delivered == std::vector<std::string>{"hello"});
        REQUIRE(second_ptr->delivered.empty());
    }

    SECTION("FallsBackInOrder") {
        DeliveryChain chain;
        chain.add(std::make_unique<FakeOutput>("type", true));
        chain.add(std::make_unique<FakeOutput>("clipboard"));

        auto res = chain.deliver("hello", ctx);
        REQUIRE(res);
        REQUIRE(res->backend == "clipboard");
        REQUIRE(res->failures == std::vector<std::string>{"type: not available"});
    }

    SECTION("AllFailListsEveryMethod") {
        DeliveryChain chain;
        chain.add(std::make_unique<FakeOutput>("type", true));
        chain.add(std::make_unique<FakeOutput>("clipboard", true));

        auto res = chain.deliver("hello", ctx);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().message ==
                "all output methods failed; type: not available; clipboard: not available");
    }

    SECTION("StopRequestedCancels") {
        DeliveryChain chain;
        auto out = std::make_unique<FakeOutput>("type");
        auto* out_ptr = out.get();
        chain.add(std::move(out));

        std::stop_source src;
        src.request_stop();
        StageContext stopped{src.get_token(), std::chrono::milliseconds(1000)};

        auto res = chain.deliver("hello", stopped);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == StageError::Kind::Cancelled);
        REQUIRE(out_ptr->delivered.empty());
    }

    SECTION("StopDuringDeliveryCancelsWithoutFallback") {
        auto hung = std::make_unique<FakeOutput>("type");
        hung->hang = true;
        auto fallback = std::make_unique<FakeOutput>("clipboard");
        auto* fallback_ptr = fallback.get();
        DeliveryChain chain;
        chain.add(std::move(hung));
        chain.add(std::move(fallback));

        std::stop_source src;
        StageContext running{src.get_token(), std::chrono::milliseconds(10000)};
        auto start = std::chrono::steady_clock::now();
        std::jthread stopper([&src] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            src.request_stop();
        });

        auto res = chain.deliver("hello", running);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == StageError::Kind::Cancelled);
        REQUIRE(res.error().message == "type: interrupted");
        REQUIRE(fallback_ptr->delivered.empty());
        REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
    }
}
