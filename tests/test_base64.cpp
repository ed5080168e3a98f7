#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/utils/base64.hpp"

#include <string>
#include <vector>

using voice_bridge::utils::base64_decode;
using voice_bridge::utils::base64_encode;

namespace {

std::vector<std::uint8_t> bytes(const std::string& text) {
    return {text.begin(), text.end()};
}

}

TEST_CASE("base64_encode pads to a multiple of four") {
    REQUIRE(base64_encode(bytes("hello")) == "aGVsbG8=");
    REQUIRE(base64_encode(bytes("hi")) == "aGk=");
    REQUIRE(base64_encode(bytes("abc")) == "YWJj");
    REQUIRE(base64_encode(bytes("")).empty());
}

TEST_CASE("base64_decode reverses standard encoding") {
    const auto decoded = base64_decode("aGVsbG8=");
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == bytes("hello"));
}

TEST_CASE("base64_decode rejects malformed input") {
    REQUIRE_FALSE(base64_decode("abc").has_value());
    REQUIRE_FALSE(base64_decode("ab$d").has_value());
    REQUIRE_FALSE(base64_decode("a=bc").has_value());
}
