#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/utils/text.hpp"

#include <string>

TEST_CASE("remove_emojis strips emoji codepoints") {
    const std::string emoji = "\xF0\x9F\x98\x80";
    const std::string input = "Hello " + emoji + " world";
    const std::string expected = "Hello  world";
    REQUIRE(voice_bridge::utils::remove_emojis(input) == expected);
}

TEST_CASE("remove_emojis leaves plain ASCII untouched") {
    const std::string input = "Plain text only.";
    REQUIRE(voice_bridge::utils::remove_emojis(input) == input);
}

TEST_CASE("normalize_text lowercases and trims whitespace") {
    const std::string input = "  Hello\tWORLD  ";
    const std::string expected = "hello world";
    REQUIRE(voice_bridge::utils::normalize_text(input) == expected);
}

TEST_CASE("trim removes surrounding whitespace only") {
    REQUIRE(voice_bridge::utils::trim("  hola  mundo \n") == "hola  mundo");
    REQUIRE(voice_bridge::utils::trim("   ").empty());
}

TEST_CASE("count_words splits on any whitespace run") {
    REQUIRE(voice_bridge::utils::count_words("") == 0);
    REQUIRE(voice_bridge::utils::count_words("one") == 1);
    REQUIRE(voice_bridge::utils::count_words("  one two\tthree\nfour ") == 4);
}

TEST_CASE("is_blank_transcript treats punctuation-only text as blank") {
    REQUIRE(voice_bridge::utils::is_blank_transcript(""));
    REQUIRE(voice_bridge::utils::is_blank_transcript("  ... ?! "));
    REQUIRE_FALSE(voice_bridge::utils::is_blank_transcript("ok."));
    REQUIRE_FALSE(voice_bridge::utils::is_blank_transcript("\xC3\xB1"));
}
