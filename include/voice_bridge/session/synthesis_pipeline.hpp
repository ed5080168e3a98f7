#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "voice_bridge/adapters/adapters.hpp"
#include "voice_bridge/audio/frame.hpp"

namespace voice_bridge {

class SynthesisPipeline : public std::enable_shared_from_this<SynthesisPipeline> {
public:
    using SynthFn = std::function<AudioStream(const std::string& text, const CancelToken& token)>;
    using ChunkFn = std::function<void(audio::AudioChunk chunk)>;
    using ReadySignalFn = std::function<void()>;

    SynthesisPipeline(int max_inflight,
                      SynthFn synth_fn,
                      ChunkFn chunk_fn,
                      ReadySignalFn ready_signal_fn);

    void enqueue(const std::string& text, const CancelToken& token);
    void cancel();
    bool has_queue() const;
    // Hands over every chunk already buffered for the head segment, moving on
    // once a segment is exhausted. Call from the thread that owns the consumer.
    void try_deliver();

private:
    struct Segment {
        std::string text;
        CancelToken token;
        AudioStream audio = std::make_shared<utils::LazySequence<audio::AudioChunk>>();
    };

    void maybe_start_synthesis();
    void run_segment(const std::shared_ptr<Segment>& segment);
    void on_synthesis_finished();
    void signal_ready();
    void pop_head(const std::shared_ptr<Segment>& segment);

    int max_inflight_;
    SynthFn synth_fn_;
    ChunkFn chunk_fn_;
    ReadySignalFn ready_signal_fn_;

    mutable std::mutex mutex_;
    std::deque<std::shared_ptr<Segment>> queue_;
    std::deque<std::shared_ptr<Segment>> pending_;
    size_t inflight_ = 0;
};

}
