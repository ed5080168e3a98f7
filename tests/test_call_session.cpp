#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/session/call_session.hpp"

#include <chrono>
#include <memory>
#include <thread>

using voice_bridge::CallSession;
using voice_bridge::CallState;
using voice_bridge::Metrics;
using voice_bridge::SessionAdapters;
using voice_bridge::SessionConfig;
using voice_bridge::Speaker;
using namespace voice_bridge::testing;

namespace {

struct Harness {
    std::shared_ptr<FakeTranscriber> transcriber;
    std::shared_ptr<voice_bridge::ResponseAdapter> responder;
    std::shared_ptr<FakeSynthesizer> synthesizer;
    SessionProbe probe;
    std::shared_ptr<CallSession> session;

    Harness(std::string call_id,
            std::string transcript,
            std::shared_ptr<voice_bridge::ResponseAdapter> responder_in,
            SessionConfig config = test_session_config())
        : transcriber(std::make_shared<FakeTranscriber>(std::move(transcript))),
          responder(std::move(responder_in)),
          synthesizer(std::make_shared<FakeSynthesizer>()) {
        config_ = config;
        call_id_ = std::move(call_id);
    }

    void start() {
        SessionAdapters adapters{transcriber, responder, synthesizer};
        session = CallSession::create(call_id_, config_, adapters,
                                      std::make_unique<voice_bridge::vad::EnergyDetector>(),
                                      probe.callbacks());
    }

    bool reaches(CallState state) {
        return wait_for([this, state]() { return session->state() == state; });
    }

    size_t drain() {
        size_t count = 0;
        while (session->outbound()->try_pop()) {
            ++count;
        }
        session->on_outbound_drained();
        return count;
    }

    SessionConfig config_;
    std::string call_id_;
};

std::shared_ptr<FakeResponder> responder(const std::string& reply) {
    return std::make_shared<FakeResponder>(reply);
}

}

TEST_CASE("a full turn goes from speech to playback and back to idle") {
    Harness h("call-a", "hola", responder("Buenos dias"));
    h.start();
    REQUIRE(h.session->state() == CallState::Idle);

    feed_utterance(*h.session, 0);
    REQUIRE(h.reaches(CallState::Speaking));
    REQUIRE(h.probe.audio_available.load() >= 1);
    REQUIRE(h.transcriber->last_frames.load() == 6);

    REQUIRE(h.drain() == 1);
    REQUIRE(h.reaches(CallState::Idle));

    const auto history = h.session->history();
    REQUIRE(history.size() == 2);
    REQUIRE(history.turns()[0].speaker == Speaker::User);
    REQUIRE(history.turns()[0].text == "hola");
    REQUIRE(history.turns()[1].speaker == Speaker::Assistant);
    REQUIRE(history.turns()[1].text == "Buenos dias");
    REQUIRE(h.synthesizer->synthesized() == std::vector<std::string>{"Buenos dias"});
}

TEST_CASE("speech during playback interrupts the turn and discards queued audio") {
    Harness h("call-barge", "hola", responder("Buenos dias"));
    h.start();
    auto sequence = feed_utterance(*h.session, 0);
    REQUIRE(h.reaches(CallState::Speaking));
    const auto generation = h.session->generation();
    const auto barge_ins = Metrics::instance().counter("barge_in");

    h.session->on_audio_frame(make_frame(sequence++, true));
    h.session->on_audio_frame(make_frame(sequence++, true));
    REQUIRE(h.reaches(CallState::Listening));
    REQUIRE(wait_for([&h]() { return h.probe.interrupted == 1; }));

    REQUIRE(h.session->generation() > generation);
    REQUIRE(h.session->outbound()->empty());
    REQUIRE(Metrics::instance().counter("barge_in") == barge_ins + 1);

    // Audio produced for the interrupted turn is refused.
    voice_bridge::audio::AudioChunk late;
    late.generation = generation;
    late.samples.assign(160, 1);
    h.session->on_audio_chunk_ready(late);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(h.session->outbound()->empty());
    REQUIRE(h.session->state() == CallState::Listening);
}

TEST_CASE("playback starts with the first chunk while synthesis is still running") {
    Harness h("call-stream", "hola", responder("Buenos dias"));
    auto synthesizer = std::make_shared<GatedStreamSynthesizer>();
    h.synthesizer = synthesizer;
    h.start();

    feed_utterance(*h.session, 0);
    REQUIRE(h.reaches(CallState::Speaking));
    REQUIRE(wait_for([&h]() { return h.probe.audio_available.load() == 1; }));

    // Playing the first chunk out does not end a turn whose audio is unfinished.
    REQUIRE(h.drain() == 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(h.session->state() == CallState::Speaking);

    synthesizer->release->open();
    REQUIRE(wait_for([&h]() { return h.probe.audio_available.load() == 3; }));
    REQUIRE(h.drain() == 2);
    REQUIRE(h.reaches(CallState::Idle));
}

TEST_CASE("barge-in stops delivery of chunks the synthesizer has not produced yet") {
    Harness h("call-barge-stream", "hola", responder("Buenos dias"));
    auto synthesizer = std::make_shared<GatedStreamSynthesizer>();
    h.synthesizer = synthesizer;
    h.start();

    auto sequence = feed_utterance(*h.session, 0);
    REQUIRE(h.reaches(CallState::Speaking));
    REQUIRE(wait_for([&h]() { return h.probe.audio_available.load() == 1; }));

    h.session->on_audio_frame(make_frame(sequence++, true));
    h.session->on_audio_frame(make_frame(sequence++, true));
    REQUIRE(h.reaches(CallState::Listening));
    REQUIRE(wait_for([&h]() { return h.probe.interrupted.load() == 1; }));
    REQUIRE(h.session->outbound()->empty());

    synthesizer->release->open();
    auto stream = synthesizer->last_stream();
    REQUIRE(stream);
    REQUIRE(wait_for([&stream]() { return stream->canceled(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(h.session->outbound()->empty());
    REQUIRE(h.probe.audio_available.load() == 1);
    REQUIRE(h.session->state() == CallState::Listening);
}

TEST_CASE("playback is not interrupted when interruptions are disabled") {
    auto config = test_session_config();
    config.interruptions_are_allowed = false;
    Harness h("call-no-barge", "hola", responder("Buenos dias"), config);
    h.start();
    auto sequence = feed_utterance(*h.session, 0);
    REQUIRE(h.reaches(CallState::Speaking));

    h.session->on_audio_frame(make_frame(sequence++, true));
    h.session->on_audio_frame(make_frame(sequence++, true));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(h.session->state() == CallState::Speaking);
    REQUIRE(h.probe.interrupted.load() == 0);

    // The caller is still talking when playback ends.
    h.drain();
    REQUIRE(h.reaches(CallState::Listening));
}

TEST_CASE("a late transcript from a timed-out turn is dropped") {
    auto config = test_session_config();
    config.turn_deadline_sec = 0.1;
    Harness h("call-deadline", "tarde", responder("no"), config);
    h.transcriber->gate = std::make_shared<Gate>();
    h.start();
    const auto deadlines = Metrics::instance().counter("turn_deadline");

    feed_utterance(*h.session, 0);
    REQUIRE(h.reaches(CallState::Transcribing));
    REQUIRE(h.reaches(CallState::Listening));
    REQUIRE(Metrics::instance().counter("turn_deadline") == deadlines + 1);

    h.transcriber->gate->open();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(h.session->history().empty());
    REQUIRE(h.session->state() == CallState::Listening);
    REQUIRE(std::static_pointer_cast<FakeResponder>(h.responder)->calls.load() == 0);
}

TEST_CASE("a stale result is ignored and counted") {
    Harness h("call-stale", "hola", responder("Buenos dias"));
    h.transcriber->gate = std::make_shared<Gate>();
    h.start();
    feed_utterance(*h.session, 0);
    REQUIRE(h.reaches(CallState::Transcribing));
    const auto stale = Metrics::instance().counter("stale_result");

    h.session->on_transcript_ready(h.session->generation() - 1, "old words");
    REQUIRE(wait_for([stale]() { return Metrics::instance().counter("stale_result") > stale; }));
    REQUIRE(h.session->state() == CallState::Transcribing);

    h.transcriber->gate->open();
    REQUIRE(h.reaches(CallState::Speaking));
    REQUIRE(h.session->history().turns()[0].text == "hola");
}

TEST_CASE("a blank transcript skips generation") {
    Harness h("call-blank", " ... ", responder("unused"));
    h.start();
    feed_utterance(*h.session, 0);
    REQUIRE(wait_for([&h]() { return h.transcriber->calls == 1; }));
    REQUIRE(h.reaches(CallState::Listening));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(h.session->history().empty());
    REQUIRE(std::static_pointer_cast<FakeResponder>(h.responder)->calls.load() == 0);
}

TEST_CASE("a reply with nothing speakable is not added to the history") {
    Harness h("call-emoji", "hola", responder("\xF0\x9F\x98\x80 !"));
    h.start();
    feed_utterance(*h.session, 0);
    REQUIRE(wait_for([&h]() {
        return std::static_pointer_cast<FakeResponder>(h.responder)->calls.load() == 1;
    }));
    REQUIRE(h.reaches(CallState::Listening));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const auto history = h.session->history();
    REQUIRE(history.size() == 1);
    REQUIRE(history.turns()[0].speaker == Speaker::User);
    REQUIRE(h.synthesizer->synthesized().empty());
}

TEST_CASE("a transcription failure drops the turn without ending the call") {
    Harness h("call-stt-fail", "hola", responder("unused"));
    h.transcriber->fail = true;
    h.start();
    const auto failures = Metrics::instance().counter("transcribe_failure");

    feed_utterance(*h.session, 0);
    REQUIRE(wait_for([failures]() {
        return Metrics::instance().counter("transcribe_failure") == failures + 1;
    }));
    REQUIRE(h.reaches(CallState::Listening));
    REQUIRE(h.session->history().empty());
}

TEST_CASE("a failing responder leaves the call listening without affecting another call") {
    auto failing = responder("unused");
    failing->fail = true;
    Harness a("call-gen-fail", "hola", failing);
    Harness b("call-healthy", "buenas", responder("Hola, en que puedo ayudar"));
    a.start();
    b.start();

    feed_utterance(*a.session, 0);
    feed_utterance(*b.session, 0);

    REQUIRE(wait_for([&failing]() { return failing->calls == 1; }));
    REQUIRE(a.reaches(CallState::Listening));
    REQUIRE(b.reaches(CallState::Speaking));

    const auto history_a = a.session->history();
    REQUIRE(history_a.size() == 1);
    REQUIRE(history_a.back().speaker == Speaker::User);
    REQUIRE(b.session->history().size() == 2);
}

TEST_CASE("a synthesis failure leaves the caller with silence for that turn") {
    Harness h("call-tts-fail", "hola", responder("Buenos dias"));
    h.synthesizer->fail = true;
    h.start();
    feed_utterance(*h.session, 0);
    REQUIRE(wait_for([&h]() { return !h.synthesizer->synthesized().empty(); }));
    REQUIRE(h.reaches(CallState::Listening));
    REQUIRE(h.session->outbound()->empty());
    REQUIRE(h.session->history().size() == 2);
}

TEST_CASE("streamed fragments are synthesized at word boundaries") {
    auto config = test_session_config();
    config.tts_max_inflight = 1;
    auto words = std::make_shared<WordStreamResponder>(
        std::vector<std::string>{"uno ", "dos ", "tres ", "cuatro ", "cinco"});
    Harness h("call-stream", "cuenta", words, config);
    h.start();

    feed_utterance(*h.session, 0);
    REQUIRE(wait_for([&h]() { return h.synthesizer->synthesized().size() == 2; }));
    REQUIRE(h.synthesizer->synthesized() ==
            std::vector<std::string>{"uno dos tres", "cuatro cinco"});
    REQUIRE(h.reaches(CallState::Speaking));
    REQUIRE(wait_for([&h]() { return h.session->outbound()->size() == 2; }));
    REQUIRE(h.session->history().back().text == "uno dos tres cuatro cinco");
}

TEST_CASE("one call keeps transcribing while another is synthesizing") {
    Harness a("call-synth", "hola", responder("Un momento por favor"));
    a.synthesizer->gate = std::make_shared<Gate>();
    Harness b("call-listen", "buenas", responder("Hola"));
    b.transcriber->gate = std::make_shared<Gate>();
    a.start();
    b.start();

    feed_utterance(*a.session, 0);
    REQUIRE(a.reaches(CallState::Synthesizing));

    feed_utterance(*b.session, 0);
    REQUIRE(b.reaches(CallState::Transcribing));
    REQUIRE(a.session->state() == CallState::Synthesizing);
    REQUIRE(b.session->history().empty());
    REQUIRE(a.session->history().size() == 2);

    a.synthesizer->gate->open();
    b.transcriber->gate->open();
    REQUIRE(a.reaches(CallState::Speaking));
    REQUIRE(b.reaches(CallState::Speaking));
}

TEST_CASE("speech during a slow turn is kept for the next turn") {
    Harness h("call-queued", "primero", responder("Vale"));
    h.transcriber->gate = std::make_shared<Gate>();
    h.start();

    auto sequence = feed_utterance(*h.session, 0);
    REQUIRE(h.reaches(CallState::Transcribing));
    feed_utterance(*h.session, sequence);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(h.transcriber->calls.load() == 1);

    h.transcriber->gate->open();
    REQUIRE(h.reaches(CallState::Speaking));
    h.drain();
    REQUIRE(wait_for([&h]() { return h.transcriber->calls == 2; }));
}

TEST_CASE("speak plays a line outside of a user turn") {
    Harness h("call-greet", "unused", responder("unused"));
    h.start();
    h.session->speak("Bienvenido");
    REQUIRE(h.reaches(CallState::Speaking));
    REQUIRE(h.session->history().back().speaker == Speaker::Assistant);

    h.drain();
    REQUIRE(h.reaches(CallState::Idle));
    REQUIRE(h.transcriber->calls.load() == 0);
}

TEST_CASE("malformed media payloads are skipped") {
    Harness h("call-malformed", "hola", responder("Buenos dias"));
    h.start();
    const auto malformed = Metrics::instance().counter("malformed_frame");

    REQUIRE_FALSE(h.session->on_media_payload("", 1));
    REQUIRE_FALSE(h.session->on_media_payload("not base64!", 2));
    REQUIRE(Metrics::instance().counter("malformed_frame") == malformed + 2);
    REQUIRE(h.session->on_media_payload("//////////8=", 3));
    REQUIRE(h.session->state() == CallState::Idle);
}

TEST_CASE("end releases the call and ignores later input") {
    Harness h("call-end", "hola", responder("Buenos dias"));
    h.start();
    feed_utterance(*h.session, 0);
    REQUIRE(h.reaches(CallState::Speaking));

    h.session->end();
    REQUIRE(h.session->state() == CallState::Ended);
    REQUIRE(h.session->outbound()->closed());
    REQUIRE(h.session->outbound()->empty());
    REQUIRE_FALSE(h.session->on_audio_frame(make_frame(100, true)));
    REQUIRE_FALSE(h.session->on_media_payload("//////////8=", 101));
    h.session->end();
    REQUIRE(h.session->state() == CallState::Ended);
}
