#include "voice_bridge/session/synthesis_pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>
#include <vector>

#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/async.hpp"

namespace voice_bridge {

SynthesisPipeline::SynthesisPipeline(int max_inflight,
                                     SynthFn synth_fn,
                                     ChunkFn chunk_fn,
                                     ReadySignalFn ready_signal_fn)
    : max_inflight_(max_inflight),
      synth_fn_(std::move(synth_fn)),
      chunk_fn_(std::move(chunk_fn)),
      ready_signal_fn_(std::move(ready_signal_fn)) {}

void SynthesisPipeline::enqueue(const std::string& text, const CancelToken& token) {
    auto segment = std::make_shared<Segment>();
    segment->text = text;
    segment->token = token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(segment);
        pending_.push_back(segment);
    }
    maybe_start_synthesis();
}

void SynthesisPipeline::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& segment : queue_) {
        segment->token.cancel();
        segment->audio->cancel();
    }
    queue_.clear();
    pending_.clear();
}

bool SynthesisPipeline::has_queue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !queue_.empty();
}

void SynthesisPipeline::try_deliver() {
    while (true) {
        std::shared_ptr<Segment> head;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                return;
            }
            head = queue_.front();
        }

        if (head->token.is_canceled()) {
            pop_head(head);
            continue;
        }

        std::optional<audio::AudioChunk> chunk;
        try {
            chunk = head->audio->try_next();
        } catch (const std::exception& ex) {
            logging::error("Synthesis failed",
                           {kv("generation", head->token.generation),
                            kv("text", head->text),
                            kv("error", ex.what())});
            pop_head(head);
            continue;
        }

        if (chunk) {
            chunk->generation = head->token.generation;
            if (chunk_fn_) {
                chunk_fn_(std::move(*chunk));
            }
            continue;
        }
        if (!head->audio->exhausted()) {
            return;
        }
        pop_head(head);
    }
}

void SynthesisPipeline::pop_head(const std::shared_ptr<Segment>& segment) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!queue_.empty() && queue_.front() == segment) {
        queue_.pop_front();
    }
}

void SynthesisPipeline::maybe_start_synthesis() {
    std::vector<std::shared_ptr<Segment>> to_start;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto max_inflight = static_cast<size_t>(std::max(1, max_inflight_));
        while (inflight_ < max_inflight && !pending_.empty()) {
            to_start.push_back(std::move(pending_.front()));
            pending_.pop_front();
            ++inflight_;
        }
    }

    for (auto& segment : to_start) {
        utils::run_async([self = shared_from_this(), segment]() {
            self->run_segment(segment);
            self->on_synthesis_finished();
        }, "synthesis");
    }
}

void SynthesisPipeline::run_segment(const std::shared_ptr<Segment>& segment) {
    if (segment->token.is_canceled()) {
        segment->audio->close();
        return;
    }
    const auto started = std::chrono::steady_clock::now();
    try {
        auto stream = synth_fn_(segment->text, segment->token);
        if (stream) {
            while (auto chunk = stream->next()) {
                if (segment->token.is_canceled() || !segment->audio->push(std::move(*chunk))) {
                    stream->cancel();
                    break;
                }
                signal_ready();
            }
        }
        segment->audio->close();
    } catch (const std::exception&) {
        segment->audio->fail(std::current_exception());
        return;
    }
    if (!segment->token.is_canceled()) {
        Metrics::instance().observe_stage_latency(
            "synthesize",
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());
    }
}

void SynthesisPipeline::on_synthesis_finished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inflight_ > 0) {
            --inflight_;
        }
    }
    signal_ready();
    maybe_start_synthesis();
}

void SynthesisPipeline::signal_ready() {
    if (ready_signal_fn_) {
        ready_signal_fn_();
    }
}

}
