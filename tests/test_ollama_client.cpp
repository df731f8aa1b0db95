#include <catch2/catch_test_macros.hpp>

#include "net/http_client.hpp"
#include "net/ollama_client.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("Ollama model lookup", "[ollama]") {
    std::vector<std::string> installed = {"llama3.2:3b", "qwen2.5:latest"};

    SECTION("UntaggedMatchesAnyTag") {
        REQUIRE(OllamaClient::has_model(installed, "llama3.2"));
        REQUIRE(OllamaClient::has_model(installed, "qwen2.5"));
    }

    SECTION("TaggedMatchesExactly") {
        REQUIRE(OllamaClient::has_model(installed, "llama3.2:3b"));
        REQUIRE(OllamaClient::has_model(installed, "qwen2.5:latest"));
        REQUIRE_FALSE(OllamaClient::has_model(installed, "llama3.2:1b"));
    }

    SECTION("Missing") {
        REQUIRE_FALSE(OllamaClient::has_model(installed, "llama3"));
        REQUIRE_FALSE(OllamaClient::has_model(installed, ""));
        REQUIRE_FALSE(OllamaClient::has_model({}, "llama3.2"));
    }
}

TEST_CASE("Ollama requests", "[ollama]") {
    HttpClient http;
    OllamaClient client(http, "http://127.0.0.1:1/");
    StageContext ctx{.timeout = 2000ms};

    SECTION("HostTrailingSlashStripped") {
        REQUIRE(client.host() == "http://127.0.0.1:1");
    }

    SECTION("InvalidUtf8PromptIsFailure") {
        // A lone lead byte cannot be serialized; the call reports it instead of throwing.
        auto res = client.generate("m", "caf\xC3", {}, ctx);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == StageError::Kind::Failure);
        REQUIRE(res.error().message.starts_with("ollama: bad request"));
    }

    SECTION("UnreachableServer") {
        auto models = client.list_models(ctx);
        REQUIRE_FALSE(models);
    }
}
