#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "voice_bridge/audio/frame.hpp"
#include "voice_bridge/session/history.hpp"
#include "voice_bridge/utils/lazy_sequence.hpp"

namespace voice_bridge {

struct CancelToken {
    uint64_t generation = 0;
    std::shared_ptr<std::atomic<bool>> canceled = std::make_shared<std::atomic<bool>>(false);

    bool is_canceled() const { return canceled && canceled->load(); }
    void cancel() const {
        if (canceled) {
            canceled->store(true);
        }
    }
};

using TextStream = std::shared_ptr<utils::LazySequence<std::string>>;
using AudioStream = std::shared_ptr<utils::LazySequence<audio::AudioChunk>>;

class TranscriptionAdapter {
public:
    virtual ~TranscriptionAdapter() = default;

    // Throws TranscriptionError on engine failure or empty audio.
    virtual std::string transcribe(const audio::Utterance& utterance,
                                   const CancelToken& token) = 0;
};

class ResponseAdapter {
public:
    virtual ~ResponseAdapter() = default;

    // Throws GenerationError.
    virtual std::string generate(const ConversationHistory& history,
                                 const CancelToken& token) = 0;

    virtual TextStream generate_stream(const ConversationHistory& history,
                                       const CancelToken& token) {
        return utils::LazySequence<std::string>::of({generate(history, token)});
    }
};

class SynthesisAdapter {
public:
    virtual ~SynthesisAdapter() = default;

    // Accepts arbitrary text boundaries. Throws SynthesisError.
    virtual audio::AudioChunk synthesize(const std::string& text,
                                         const CancelToken& token) = 0;

    virtual AudioStream synthesize_stream(const std::string& text,
                                          const CancelToken& token) {
        return utils::LazySequence<audio::AudioChunk>::of({synthesize(text, token)});
    }
};

}
