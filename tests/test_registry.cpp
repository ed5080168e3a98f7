#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "voice_bridge/errors.hpp"
#include "voice_bridge/session/registry.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using voice_bridge::CallSession;
using voice_bridge::CallState;
using voice_bridge::SessionRegistry;
using namespace voice_bridge::testing;

namespace {

SessionRegistry::Factory session_factory() {
    auto transcriber = std::make_shared<FakeTranscriber>("hola");
    auto responder = std::make_shared<FakeResponder>("Buenos dias");
    auto synthesizer = std::make_shared<FakeSynthesizer>();
    return [transcriber, responder, synthesizer](const std::string& call_id) {
        return CallSession::create(call_id, test_session_config(),
                                   {transcriber, responder, synthesizer},
                                   std::make_unique<voice_bridge::vad::EnergyDetector>());
    };
}

}

TEST_CASE("create registers a session retrievable by id") {
    SessionRegistry registry(session_factory(), 8);
    auto session = registry.create("CA1");
    REQUIRE(session->id() == "CA1");
    REQUIRE(registry.get("CA1") == session);
    REQUIRE(registry.find("CA1") == session);
    REQUIRE(registry.size() == 1);
}

TEST_CASE("create on an existing id fails with DuplicateSessionError") {
    SessionRegistry registry(session_factory(), 8);
    auto first = registry.create("CA1");
    REQUIRE_THROWS_AS(registry.create("CA1"), voice_bridge::DuplicateSessionError);
    REQUIRE(registry.get("CA1") == first);
    REQUIRE(first->state() == CallState::Idle);
}

TEST_CASE("get and remove on an absent id fail with UnknownSessionError") {
    SessionRegistry registry(session_factory(), 8);
    REQUIRE_THROWS_AS(registry.get("missing"), voice_bridge::UnknownSessionError);
    REQUIRE_THROWS_AS(registry.remove("missing"), voice_bridge::UnknownSessionError);
    REQUIRE(registry.find("missing") == nullptr);
}

TEST_CASE("remove ends the session and forgets it") {
    SessionRegistry registry(session_factory(), 8);
    auto session = registry.create("CA1");
    registry.remove("CA1");
    REQUIRE(session->state() == CallState::Ended);
    REQUIRE(registry.size() == 0);
    REQUIRE_THROWS_AS(registry.remove("CA1"), voice_bridge::UnknownSessionError);
}

TEST_CASE("the session limit rejects extra calls") {
    SessionRegistry registry(session_factory(), 2);
    registry.create("CA1");
    registry.create("CA2");
    REQUIRE_THROWS_AS(registry.create("CA3"), voice_bridge::SessionLimitError);
    registry.remove("CA1");
    REQUIRE_NOTHROW(registry.create("CA3"));
}

TEST_CASE("a failing factory releases the reserved id") {
    SessionRegistry registry([](const std::string&) -> std::shared_ptr<CallSession> {
        throw std::runtime_error("no detector");
    }, 8);
    REQUIRE_THROWS_AS(registry.create("CA1"), std::runtime_error);
    REQUIRE(registry.size() == 0);
}

TEST_CASE("concurrent creates with distinct ids all succeed") {
    SessionRegistry registry(session_factory(), 64);
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&registry, &failures, i]() {
            try {
                registry.create("CA" + std::to_string(i));
            } catch (const std::exception&) {
                ++failures;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(failures.load() == 0);
    REQUIRE(registry.size() == 16);
    for (int i = 0; i < 16; ++i) {
        REQUIRE(registry.get("CA" + std::to_string(i))->id() == "CA" + std::to_string(i));
    }
    registry.end_all();
    REQUIRE(registry.size() == 0);
}

TEST_CASE("concurrent creates of one id admit exactly one") {
    SessionRegistry registry(session_factory(), 64);
    std::vector<std::thread> threads;
    std::atomic<int> created{0};
    std::atomic<int> duplicates{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            try {
                registry.create("CA-same");
                ++created;
            } catch (const voice_bridge::DuplicateSessionError&) {
                ++duplicates;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(created.load() == 1);
    REQUIRE(duplicates.load() == 7);
}

TEST_CASE("ids are listed in sorted order") {
    SessionRegistry registry(session_factory(), 8);
    registry.create("CB");
    registry.create("CA");
    REQUIRE(registry.ids() == std::vector<std::string>{"CA", "CB"});
}
