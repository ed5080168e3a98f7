#include "voice_bridge/session/segment_buffer.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <vector>

#include "voice_bridge/config.hpp"
#include "voice_bridge/logging.hpp"

namespace voice_bridge {

SegmentConfig SegmentConfig::from_config(const Config& config) {
    SegmentConfig result;
    result.speech_debounce_frames = config.speech_debounce_frames;
    result.silence_trail_frames = config.silence_trail_frames;
    result.max_utterance_ms = config.max_utterance_ms;
    result.pre_roll_frames = config.pre_roll_frames;
    result.min_voiced_ms = config.min_voiced_ms;
    result.user_silence_timeout_ms = config.user_silence_timeout_ms;
    return result;
}

const char* to_string(SegmentEvent::Kind kind) {
    switch (kind) {
        case SegmentEvent::Kind::SpeechStarted:
            return "speech_started";
        case SegmentEvent::Kind::SpeechContinuing:
            return "speech_continuing";
        case SegmentEvent::Kind::UtteranceReady:
            return "utterance_ready";
        case SegmentEvent::Kind::UtteranceDiscarded:
            return "utterance_discarded";
        case SegmentEvent::Kind::Timeout:
            return "timeout";
    }
    return "unknown";
}

SegmentBuffer::SegmentBuffer(SegmentConfig config,
                             std::unique_ptr<vad::VoiceActivityDetector> detector,
                             std::string call_id)
    : config_(config),
      detector_(std::move(detector)),
      call_id_(std::move(call_id)) {
    if (!detector_) {
        throw std::invalid_argument("SegmentBuffer requires a voice activity detector");
    }
    if (config_.speech_debounce_frames <= 0 || config_.silence_trail_frames <= 0) {
        throw std::invalid_argument("debounce and trail frame counts must be positive");
    }
}

std::optional<SegmentEvent> SegmentBuffer::push(const audio::AudioFrame& frame) {
    if (last_sequence_ && frame.sequence <= *last_sequence_) {
        logging::debug("Dropping out-of-order frame",
                       {kv("call_id", call_id_),
                        kv("sequence", frame.sequence),
                        kv("last_sequence", *last_sequence_)});
        return std::nullopt;
    }
    if (last_sequence_ && frame.sequence > *last_sequence_ + 1) {
        dropped_frames_ += frame.sequence - *last_sequence_ - 1;
    }
    last_sequence_ = frame.sequence;

    const bool speech = detector_->classify(frame);
    if (listening_) {
        return push_listening(frame, speech);
    }
    return push_idle(frame, speech);
}

std::optional<SegmentEvent> SegmentBuffer::push_idle(const audio::AudioFrame& frame, bool speech) {
    if (speech) {
        speech_run_.push_back(frame);
        idle_ms_ = 0;
        if (speech_run_.size() >= static_cast<size_t>(config_.speech_debounce_frames)) {
            return open_utterance();
        }
        return std::nullopt;
    }

    for (auto& pending : speech_run_) {
        add_pre_roll(std::move(pending));
    }
    speech_run_.clear();
    add_pre_roll(frame);

    idle_ms_ += frame.duration_ms();
    if (config_.user_silence_timeout_ms > 0 && !timeout_fired_ &&
        idle_ms_ >= config_.user_silence_timeout_ms) {
        timeout_fired_ = true;
        return SegmentEvent{SegmentEvent::Kind::Timeout, std::nullopt};
    }
    return std::nullopt;
}

std::optional<SegmentEvent> SegmentBuffer::push_listening(const audio::AudioFrame& frame,
                                                          bool speech) {
    if (utterance_ms_ + frame.duration_ms() > config_.max_utterance_ms) {
        auto event = close_utterance(true);
        if (speech) {
            speech_run_.push_back(frame);
        } else {
            add_pre_roll(frame);
        }
        return event;
    }

    utterance_.push_back(frame);
    utterance_ms_ += frame.duration_ms();
    if (speech) {
        voiced_ms_ += frame.duration_ms();
        silence_run_ = 0;
        return SegmentEvent{SegmentEvent::Kind::SpeechContinuing, std::nullopt};
    }

    ++silence_run_;
    if (silence_run_ >= config_.silence_trail_frames) {
        // Silence tail as long as the speech debounce; the rest is pre-roll.
        const int tail = std::max(0, std::min(config_.speech_debounce_frames, silence_run_ - 1));
        std::vector<audio::AudioFrame> carried(
            std::make_move_iterator(utterance_.end() - (silence_run_ - tail)),
            std::make_move_iterator(utterance_.end()));
        utterance_.erase(utterance_.end() - (silence_run_ - tail), utterance_.end());
        for (const auto& frame : carried) {
            utterance_ms_ -= frame.duration_ms();
        }
        auto event = close_utterance(false);
        for (auto& frame : carried) {
            add_pre_roll(std::move(frame));
        }
        return event;
    }
    return SegmentEvent{SegmentEvent::Kind::SpeechContinuing, std::nullopt};
}

SegmentEvent SegmentBuffer::open_utterance() {
    utterance_.assign(std::make_move_iterator(pre_roll_.begin()),
                      std::make_move_iterator(pre_roll_.end()));
    pre_roll_.clear();
    utterance_ms_ = 0;
    for (const auto& frame : utterance_) {
        utterance_ms_ += frame.duration_ms();
    }
    voiced_ms_ = 0;
    for (auto& frame : speech_run_) {
        utterance_ms_ += frame.duration_ms();
        voiced_ms_ += frame.duration_ms();
        utterance_.push_back(std::move(frame));
    }
    speech_run_.clear();
    silence_run_ = 0;
    listening_ = true;
    timeout_fired_ = false;
    return SegmentEvent{SegmentEvent::Kind::SpeechStarted, std::nullopt};
}

SegmentEvent SegmentBuffer::close_utterance(bool forced) {
    audio::Utterance utterance;
    utterance.sample_rate = utterance_.empty() ? 0 : utterance_.front().sample_rate;
    utterance.voiced_ms = voiced_ms_;
    utterance.frames = std::move(utterance_);

    utterance_.clear();
    utterance_ms_ = 0;
    voiced_ms_ = 0;
    silence_run_ = 0;
    listening_ = false;
    idle_ms_ = 0;
    timeout_fired_ = false;

    if (utterance.empty() || utterance.voiced_ms < config_.min_voiced_ms) {
        logging::debug("Utterance below minimum voiced duration discarded",
                       {kv("call_id", call_id_),
                        kv("voiced_ms", utterance.voiced_ms),
                        kv("min_ms", config_.min_voiced_ms)});
        return SegmentEvent{SegmentEvent::Kind::UtteranceDiscarded, std::nullopt};
    }
    logging::debug("Utterance closed",
                   {kv("call_id", call_id_),
                    kv("frames", utterance.frames.size()),
                    kv("duration_ms", utterance.duration_ms()),
                    kv("voiced_ms", utterance.voiced_ms),
                    kv("forced", forced)});
    return SegmentEvent{SegmentEvent::Kind::UtteranceReady, std::move(utterance)};
}

void SegmentBuffer::add_pre_roll(audio::AudioFrame frame) {
    if (config_.pre_roll_frames <= 0) {
        return;
    }
    pre_roll_.push_back(std::move(frame));
    while (pre_roll_.size() > static_cast<size_t>(config_.pre_roll_frames)) {
        pre_roll_.pop_front();
    }
}

void SegmentBuffer::reset() {
    listening_ = false;
    pre_roll_.clear();
    speech_run_.clear();
    utterance_.clear();
    utterance_.shrink_to_fit();
    utterance_ms_ = 0;
    voiced_ms_ = 0;
    silence_run_ = 0;
    idle_ms_ = 0;
    timeout_fired_ = false;
    detector_->reset();
}

void SegmentBuffer::restart_silence_timer() {
    idle_ms_ = 0;
    timeout_fired_ = false;
}

size_t SegmentBuffer::buffered_frames() const {
    return pre_roll_.size() + speech_run_.size() + utterance_.size();
}

}
