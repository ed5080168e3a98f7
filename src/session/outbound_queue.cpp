#include "voice_bridge/session/outbound_queue.hpp"

namespace voice_bridge {

bool OutboundAudioQueue::push(audio::AudioChunk chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || chunk.generation < floor_generation_) {
            return false;
        }
        chunks_.push_back(std::move(chunk));
    }
    cv_.notify_one();
    return true;
}

std::optional<audio::AudioChunk> OutboundAudioQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (chunks_.empty()) {
        return std::nullopt;
    }
    auto chunk = std::move(chunks_.front());
    chunks_.pop_front();
    return chunk;
}

std::optional<audio::AudioChunk> OutboundAudioQueue::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return closed_ || !chunks_.empty(); });
    if (chunks_.empty()) {
        return std::nullopt;
    }
    auto chunk = std::move(chunks_.front());
    chunks_.pop_front();
    return chunk;
}

size_t OutboundAudioQueue::discard(uint64_t floor_generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto dropped = chunks_.size();
    chunks_.clear();
    if (floor_generation > floor_generation_) {
        floor_generation_ = floor_generation;
    }
    return dropped;
}

void OutboundAudioQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        chunks_.clear();
    }
    cv_.notify_all();
}

bool OutboundAudioQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool OutboundAudioQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.empty();
}

size_t OutboundAudioQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

}
