#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "voice_bridge/audio/frame.hpp"

namespace voice_bridge {

class OutboundAudioQueue {
public:
    bool push(audio::AudioChunk chunk);
    std::optional<audio::AudioChunk> try_pop();
    std::optional<audio::AudioChunk> pop_for(std::chrono::milliseconds timeout);

    // Drops queued chunks and rejects future chunks below the floor.
    size_t discard(uint64_t floor_generation);
    void close();

    bool closed() const;
    bool empty() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<audio::AudioChunk> chunks_;
    uint64_t floor_generation_ = 0;
    bool closed_ = false;
};

}
