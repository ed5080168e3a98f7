#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/adapters/openai.hpp"
#include "voice_bridge/adapters/sse.hpp"
#include "voice_bridge/session/history.hpp"

#include <string>

using voice_bridge::SseDecoder;
using voice_bridge::parse_chat_delta;

namespace {

std::vector<std::string> feed(SseDecoder& decoder, const std::string& chunk) {
    return decoder.feed(chunk.data(), chunk.size());
}

}

TEST_CASE("SseDecoder emits events split across reads") {
    SseDecoder decoder;
    REQUIRE(feed(decoder, "data: {\"a\"").empty());
    REQUIRE(feed(decoder, ":1}\n").empty());
    const auto events = feed(decoder, "\ndata: [DONE]\n\n");
    REQUIRE(events == std::vector<std::string>{"{\"a\":1}", "[DONE]"});
}

TEST_CASE("SseDecoder joins multi-line data and skips comments") {
    SseDecoder decoder;
    const auto events = feed(decoder, ": keep-alive\r\nevent: delta\r\ndata: one\r\ndata: two\r\n\r\n");
    REQUIRE(events == std::vector<std::string>{"one\ntwo"});
}

TEST_CASE("SseDecoder flushes a trailing event on finish") {
    SseDecoder decoder;
    REQUIRE(feed(decoder, "data: tail").empty());
    REQUIRE(decoder.finish() == std::vector<std::string>{"tail"});
}

TEST_CASE("parse_chat_delta extracts streamed content") {
    REQUIRE(parse_chat_delta(R"({"choices":[{"delta":{"content":"Hola"}}]})") ==
            std::string("Hola"));
    REQUIRE_FALSE(parse_chat_delta(R"({"choices":[{"delta":{"role":"assistant"}}]})").has_value());
    REQUIRE_FALSE(parse_chat_delta(R"({"choices":[]})").has_value());
    REQUIRE_FALSE(parse_chat_delta("not json").has_value());
}

TEST_CASE("build_chat_messages maps the conversation to chat roles") {
    voice_bridge::ConversationHistory history;
    history.append(voice_bridge::Speaker::User, "hola");
    history.append(voice_bridge::Speaker::Assistant, "buenas");

    const auto messages = voice_bridge::build_chat_messages(history, std::string("Be brief"));
    REQUIRE(messages.size() == 3);
    REQUIRE(messages[0]["role"] == "system");
    REQUIRE(messages[1]["role"] == "user");
    REQUIRE(messages[1]["content"] == "hola");
    REQUIRE(messages[2]["role"] == "assistant");

    REQUIRE(voice_bridge::build_chat_messages(history, std::nullopt).size() == 2);
}
