#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/utils/lazy_sequence.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using voice_bridge::utils::LazySequence;

TEST_CASE("items arrive in push order and then the sequence ends") {
    auto sequence = LazySequence<int>::of({1, 2, 3});
    REQUIRE(sequence->next() == 1);
    REQUIRE(sequence->next() == 2);
    REQUIRE(sequence->next() == 3);
    REQUIRE_FALSE(sequence->next().has_value());
    REQUIRE_FALSE(sequence->push(4));
}

TEST_CASE("a producer error surfaces after the queued items") {
    LazySequence<std::string> sequence;
    sequence.push("partial");
    sequence.fail(std::make_exception_ptr(std::runtime_error("stream broke")));
    REQUIRE(sequence.next() == std::string("partial"));
    REQUIRE_THROWS_AS(sequence.next(), std::runtime_error);
}

TEST_CASE("the consumer blocks until a producer thread delivers") {
    LazySequence<int> sequence;
    std::thread producer([&sequence]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        sequence.push(7);
        sequence.close();
    });
    REQUIRE(sequence.next() == 7);
    REQUIRE_FALSE(sequence.next().has_value());
    producer.join();
}

TEST_CASE("cancel wakes a waiting consumer and rejects further items") {
    LazySequence<int> sequence;
    std::thread canceler([&sequence]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        sequence.cancel();
    });
    REQUIRE_FALSE(sequence.next().has_value());
    canceler.join();
    REQUIRE(sequence.canceled());
    REQUIRE_FALSE(sequence.push(1));
}

TEST_CASE("try_next never blocks and reports exhaustion after the last item") {
    LazySequence<int> sequence;
    REQUIRE_FALSE(sequence.try_next().has_value());
    REQUIRE_FALSE(sequence.exhausted());

    sequence.push(7);
    REQUIRE(sequence.try_next() == 7);
    REQUIRE_FALSE(sequence.exhausted());

    sequence.fail(std::make_exception_ptr(std::runtime_error("stream broke")));
    REQUIRE_FALSE(sequence.exhausted());
    REQUIRE_THROWS_AS(sequence.try_next(), std::runtime_error);
    REQUIRE(sequence.exhausted());
}
