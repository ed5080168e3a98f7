#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "voice_bridge/adapters/adapters.hpp"
#include "voice_bridge/audio/frame.hpp"
#include "voice_bridge/errors.hpp"
#include "voice_bridge/session/call_session.hpp"
#include "voice_bridge/vad/detector.hpp"

namespace voice_bridge::testing {

// 20 ms at 8 kHz. Speech is a full-scale-ish square wave, silence is zeros.
inline audio::AudioFrame make_frame(uint64_t sequence, bool speech, int sample_rate = 8000) {
    audio::AudioFrame frame;
    frame.sequence = sequence;
    frame.sample_rate = sample_rate;
    frame.samples.assign(static_cast<size_t>(sample_rate / 50), 0);
    if (speech) {
        for (size_t i = 0; i < frame.samples.size(); ++i) {
            frame.samples[i] = (i / 4) % 2 == 0 ? 8000 : -8000;
        }
    }
    return frame;
}

inline bool wait_for(const std::function<bool()>& predicate,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::seconds(5), [this]() { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

class FakeTranscriber : public TranscriptionAdapter {
public:
    explicit FakeTranscriber(std::string text) : text_(std::move(text)) {}

    std::string transcribe(const audio::Utterance& utterance, const CancelToken&) override {
        ++calls;
        last_frames = utterance.frames.size();
        if (gate) {
            gate->wait();
        }
        if (fail) {
            throw TranscriptionError("engine unavailable");
        }
        return text_;
    }

    std::shared_ptr<Gate> gate;
    bool fail = false;
    std::atomic<int> calls{0};
    std::atomic<size_t> last_frames{0};

private:
    std::string text_;
};

class FakeResponder : public ResponseAdapter {
public:
    explicit FakeResponder(std::string reply) : reply_(std::move(reply)) {}

    std::string generate(const ConversationHistory& history, const CancelToken&) override {
        ++calls;
        last_history_size = history.size();
        if (fail) {
            throw GenerationError("model unavailable");
        }
        return reply_;
    }

    bool fail = false;
    std::atomic<int> calls{0};
    std::atomic<size_t> last_history_size{0};

private:
    std::string reply_;
};

// Emits one streamed fragment per word.
class WordStreamResponder : public ResponseAdapter {
public:
    explicit WordStreamResponder(std::vector<std::string> words) : words_(std::move(words)) {}

    std::string generate(const ConversationHistory&, const CancelToken&) override {
        std::string text;
        for (const auto& word : words_) {
            text += word;
        }
        return text;
    }

    TextStream generate_stream(const ConversationHistory&, const CancelToken&) override {
        return utils::LazySequence<std::string>::of(words_);
    }

private:
    std::vector<std::string> words_;
};

class FakeSynthesizer : public SynthesisAdapter {
public:
    audio::AudioChunk synthesize(const std::string& text, const CancelToken& token) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            texts.push_back(text);
        }
        if (gate) {
            gate->wait();
        }
        if (fail) {
            throw SynthesisError("voice unavailable");
        }
        audio::AudioChunk chunk;
        chunk.generation = token.generation;
        chunk.sample_rate = 8000;
        chunk.samples.assign(160, 100);
        return chunk;
    }

    std::vector<std::string> synthesized() {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts;
    }

    std::shared_ptr<Gate> gate;
    bool fail = false;

private:
    std::mutex mutex_;
    std::vector<std::string> texts;
};

// First chunk right away, two more once release is opened.
class GatedStreamSynthesizer : public FakeSynthesizer {
public:
    AudioStream synthesize_stream(const std::string& text, const CancelToken& token) override {
        auto first = synthesize(text, token);
        auto stream = std::make_shared<utils::LazySequence<audio::AudioChunk>>();
        stream->push(first);
        {
            std::lock_guard<std::mutex> lock(stream_mutex_);
            last_stream_ = stream;
        }
        std::thread([stream, first, release = release]() {
            release->wait();
            for (int i = 0; i < 2; ++i) {
                if (!stream->push(first)) {
                    break;
                }
            }
            stream->close();
        }).detach();
        return stream;
    }

    AudioStream last_stream() {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        return last_stream_;
    }

    std::shared_ptr<Gate> release = std::make_shared<Gate>();

private:
    std::mutex stream_mutex_;
    AudioStream last_stream_;
};

inline SessionConfig test_session_config() {
    SessionConfig config;
    config.segment.speech_debounce_frames = 2;
    config.segment.silence_trail_frames = 3;
    config.segment.max_utterance_ms = 5000;
    config.segment.pre_roll_frames = 2;
    config.segment.min_voiced_ms = 40;
    config.segment.user_silence_timeout_ms = 0;
    config.encoding = audio::Encoding::Mulaw;
    config.sample_rate = 8000;
    config.turn_deadline_sec = 0.0;
    config.partial_tts_min_words = 3;
    return config;
}

struct SessionProbe {
    std::atomic<int> audio_available{0};
    std::atomic<int> interrupted{0};
    std::atomic<int> silence_timeouts{0};

    SessionCallbacks callbacks() {
        SessionCallbacks result;
        result.on_audio_available = [this](const std::string&) { ++audio_available; };
        result.on_playback_interrupted = [this](const std::string&) { ++interrupted; };
        result.on_silence_timeout = [this](const std::string&) { ++silence_timeouts; };
        return result;
    }
};

// Speech then enough silence to close one utterance. Returns the next
// unused sequence number.
inline uint64_t feed_utterance(CallSession& session, uint64_t sequence,
                               int speech_frames = 4, int silence_frames = 3) {
    for (int i = 0; i < speech_frames; ++i) {
        session.on_audio_frame(make_frame(sequence++, true));
    }
    for (int i = 0; i < silence_frames; ++i) {
        session.on_audio_frame(make_frame(sequence++, false));
    }
    return sequence;
}

}
