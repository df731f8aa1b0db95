#include <catch2/catch_test_macros.hpp>

#include "pipeline/text_rules.hpp"

#include <map>
#include <string>
#include <vector>

TEST_CASE("Text helpers", "[text]") {

    SECTION("Trim") {
        REQUIRE(text::trim("  hello \n") == "hello");
        REQUIRE(text::trim(" \t\r\n").empty());
        REQUIRE(text::trim("").empty());
    }

    SECTION("WordCount") {
        REQUIRE(text::word_count("  two  words ") == 2);
        REQUIRE(text::word_count("") == 0);
        REQUIRE(text::word_count("one\ttwo\nthree") == 3);
    }

    SECTION("Utf8Prefix") {
        // "€" is three bytes; a cut through it backs off to the character start.
        std::string s = "ab\xE2\x82\xAC" "cd";
        REQUIRE(text::utf8_prefix(s, 3) == "ab");
        REQUIRE(text::utf8_prefix(s, 4) == "ab");
        REQUIRE(text::utf8_prefix(s, 5) == "ab\xE2\x82\xAC");
        REQUIRE(text::utf8_prefix(s, 100) == s);
        REQUIRE(text::utf8_prefix("", 3).empty());
    }
}

TEST_CASE("apply_corrections", "[text]") {

    SECTION("CaseInsensitiveWholeWord") {
        std::map<std::string, std::string> dict{{"teh", "the"}};
        REQUIRE(text::apply_corrections("Teh cat saw teh dog", dict) == "the cat saw the dog");
    }

    SECTION("PartialWordsUntouched") {
        std::map<std::string, std::string> dict{{"teh", "the"}};
        REQUIRE(text::apply_corrections("flew to tehran", dict) == "flew to tehran");
    }

    SECTION("LongestKeyFirst") {
        std::map<std::string, std::string> dict{{"pipe", "tube"}, {"pipe wire", "PipeWire"}};
        REQUIRE(text::apply_corrections("use pipe wire not a pipe", dict) ==
                "use PipeWire not a tube");
    }

    SECTION("PunctuationAroundWords") {
        std::map<std::string, std::string> dict{{"cube control", "kubectl"}};
        REQUIRE(text::apply_corrections("Run cube control, then wait.", dict) ==
                "Run kubectl, then wait.");
    }

    SECTION("EmptyDictionary") {
        REQUIRE(text::apply_corrections("unchanged", {}) == "unchanged");
    }
}

TEST_CASE("is_hallucination", "[text]") {
    REQUIRE(text::is_hallucination("Thank you."));
    REQUIRE(text::is_hallucination("  you  "));
    REQUIRE(text::is_hallucination("Thanks for watching"));
    REQUIRE_FALSE(text::is_hallucination("thank you for the review"));
    REQUIRE_FALSE(text::is_hallucination("deploy the build"));
}

TEST_CASE("Final text and delivery", "[text]") {

    SECTION("SelectFinal") {
        REQUIRE(text::select_final("raw", "fixed", true) == "fixed");
        REQUIRE(text::select_final("raw", "fixed", false) == "raw");
        REQUIRE(text::select_final("raw", "", true) == "raw");
    }

    SECTION("FormatDelivery") {
        REQUIRE(text::format_delivery(OutputMode::RawOnly, "raw", "fixed") == "raw");
        REQUIRE(text::format_delivery(OutputMode::CorrectedOnly, "raw", "fixed") == "fixed");
        REQUIRE(text::format_delivery(OutputMode::Both, "raw", "fixed") == "fixed [raw]");
        REQUIRE(text::format_delivery(OutputMode::Both, "same", "same") == "same");
    }
}

TEST_CASE("Vocabulary terms", "[text]") {

    SECTION("Split") {
        REQUIRE(text::split_terms("a, b ,,c ") == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(text::split_terms("").empty());
        REQUIRE(text::split_terms(" , ").empty());
    }

    SECTION("MergeSkipsExisting") {
        std::vector<std::string> vocab{"PipeWire"};
        REQUIRE(text::merge_terms(vocab, {"pipewire", "Catch2", "catch2"}) == 1);
        REQUIRE(vocab == std::vector<std::string>{"PipeWire", "Catch2"});
    }
}
