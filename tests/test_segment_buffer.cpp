#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "voice_bridge/session/segment_buffer.hpp"

#include <vector>

using voice_bridge::SegmentBuffer;
using voice_bridge::SegmentConfig;
using voice_bridge::SegmentEvent;
using voice_bridge::testing::make_frame;

namespace {

SegmentBuffer make_buffer(SegmentConfig config) {
    return SegmentBuffer(config, std::make_unique<voice_bridge::vad::EnergyDetector>());
}

SegmentConfig base_config() {
    SegmentConfig config;
    config.speech_debounce_frames = 3;
    config.silence_trail_frames = 5;
    config.max_utterance_ms = 20000;
    config.pre_roll_frames = 10;
    config.min_voiced_ms = 0;
    config.user_silence_timeout_ms = 0;
    return config;
}

struct Fed {
    std::vector<SegmentEvent> events;
    std::vector<size_t> positions;
};

Fed feed(SegmentBuffer& buffer, const std::vector<bool>& pattern, uint64_t first_sequence = 0) {
    Fed fed;
    for (size_t i = 0; i < pattern.size(); ++i) {
        auto event = buffer.push(make_frame(first_sequence + i, pattern[i]));
        if (event && event->kind != SegmentEvent::Kind::SpeechContinuing) {
            fed.events.push_back(std::move(*event));
            fed.positions.push_back(i);
        }
    }
    return fed;
}

std::vector<bool> pattern(std::initializer_list<std::pair<bool, int>> runs) {
    std::vector<bool> result;
    for (const auto& run : runs) {
        result.insert(result.end(), static_cast<size_t>(run.second), run.first);
    }
    return result;
}

}

TEST_CASE("silence, speech, silence yields one utterance with a debounce-long silence tail") {
    auto buffer = make_buffer(base_config());
    const auto fed = feed(buffer, pattern({{false, 5}, {true, 10}, {false, 8}}));

    REQUIRE(fed.events.size() == 2);
    REQUIRE(fed.events[0].kind == SegmentEvent::Kind::SpeechStarted);
    REQUIRE(fed.positions[0] == 7);
    REQUIRE(fed.events[1].kind == SegmentEvent::Kind::UtteranceReady);
    REQUIRE(fed.positions[1] == 19);

    const auto& utterance = *fed.events[1].utterance;
    // 5 pre-roll + 10 speech + the first 3 trailing silence frames.
    REQUIRE(utterance.frames.size() == 18);
    REQUIRE(utterance.frames.front().sequence == 0);
    REQUIRE(utterance.frames.back().sequence == 17);
    REQUIRE(utterance.voiced_ms == 200);
    REQUIRE(utterance.duration_ms() == 360);
    REQUIRE_FALSE(buffer.listening());
}

TEST_CASE("silence cut from the tail becomes pre-roll of the next utterance") {
    auto buffer = make_buffer(base_config());
    const auto fed = feed(buffer, pattern({{true, 3}, {false, 5}, {true, 3}, {false, 5}}));

    REQUIRE(fed.events.size() == 4);
    const auto& first = *fed.events[1].utterance;
    REQUIRE(first.frames.size() == 6);
    REQUIRE(first.frames.back().sequence == 5);

    const auto& second = *fed.events[3].utterance;
    // Frames 6 and 7 were left over from the first closing run.
    REQUIRE(second.frames.front().sequence == 6);
    REQUIRE(second.frames.size() == 8);
}

TEST_CASE("speech shorter than the debounce never opens an utterance") {
    auto buffer = make_buffer(base_config());
    const auto fed = feed(buffer, pattern({{true, 2}, {false, 4}, {true, 2}, {false, 10}}));
    REQUIRE(fed.events.empty());
    REQUIRE_FALSE(buffer.listening());
}

TEST_CASE("pre-roll is bounded by its configured size") {
    auto config = base_config();
    config.pre_roll_frames = 2;
    auto buffer = make_buffer(config);
    const auto fed = feed(buffer, pattern({{false, 6}, {true, 3}, {false, 5}}));

    REQUIRE(fed.events.size() == 2);
    const auto& utterance = *fed.events[1].utterance;
    // 2 pre-roll + 3 speech + 3 trailing silence.
    REQUIRE(utterance.frames.size() == 8);
    REQUIRE(utterance.frames.front().sequence == 4);
}

TEST_CASE("utterances below the minimum voiced duration are discarded") {
    auto config = base_config();
    config.min_voiced_ms = 200;
    auto buffer = make_buffer(config);
    const auto fed = feed(buffer, pattern({{true, 4}, {false, 5}}));

    REQUIRE(fed.events.size() == 2);
    REQUIRE(fed.events[1].kind == SegmentEvent::Kind::UtteranceDiscarded);
    REQUIRE_FALSE(fed.events[1].utterance.has_value());
}

TEST_CASE("the duration cap force-closes an utterance and speech carries over") {
    auto config = base_config();
    config.speech_debounce_frames = 2;
    config.pre_roll_frames = 0;
    config.max_utterance_ms = 200;
    auto buffer = make_buffer(config);
    const auto fed = feed(buffer, pattern({{true, 12}}));

    REQUIRE(fed.events.size() == 3);
    REQUIRE(fed.events[0].kind == SegmentEvent::Kind::SpeechStarted);
    REQUIRE(fed.events[1].kind == SegmentEvent::Kind::UtteranceReady);
    REQUIRE(fed.positions[1] == 10);
    REQUIRE(fed.events[1].utterance->frames.size() == 10);
    REQUIRE(fed.events[1].utterance->duration_ms() <= 200);
    REQUIRE(fed.events[2].kind == SegmentEvent::Kind::SpeechStarted);
    REQUIRE(fed.positions[2] == 11);
}

TEST_CASE("duplicate and out-of-order frames are dropped, gaps are counted") {
    auto buffer = make_buffer(base_config());
    REQUIRE_FALSE(buffer.push(make_frame(5, true)).has_value());
    REQUIRE_FALSE(buffer.push(make_frame(5, true)).has_value());
    REQUIRE_FALSE(buffer.push(make_frame(3, true)).has_value());
    REQUIRE(buffer.buffered_frames() == 1);

    REQUIRE_FALSE(buffer.push(make_frame(8, true)).has_value());
    REQUIRE(buffer.dropped_frames() == 2);
}

TEST_CASE("idle silence raises one timeout per idle period") {
    auto config = base_config();
    config.user_silence_timeout_ms = 100;
    auto buffer = make_buffer(config);

    const auto first = feed(buffer, pattern({{false, 8}}));
    REQUIRE(first.events.size() == 1);
    REQUIRE(first.events[0].kind == SegmentEvent::Kind::Timeout);
    REQUIRE(first.positions[0] == 4);

    buffer.restart_silence_timer();
    const auto second = feed(buffer, pattern({{false, 5}}), 8);
    REQUIRE(second.events.size() == 1);
    REQUIRE(second.events[0].kind == SegmentEvent::Kind::Timeout);
}

TEST_CASE("reset drops buffered audio") {
    auto buffer = make_buffer(base_config());
    feed(buffer, pattern({{false, 3}, {true, 4}}));
    REQUIRE(buffer.listening());
    buffer.reset();
    REQUIRE_FALSE(buffer.listening());
    REQUIRE(buffer.buffered_frames() == 0);
}
