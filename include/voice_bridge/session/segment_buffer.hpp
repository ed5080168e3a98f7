#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "voice_bridge/audio/frame.hpp"
#include "voice_bridge/vad/detector.hpp"

namespace voice_bridge {

struct Config;

struct SegmentConfig {
    int speech_debounce_frames = 3;
    int silence_trail_frames = 25;
    int max_utterance_ms = 20000;
    int pre_roll_frames = 10;
    int min_voiced_ms = 200;
    // Zero disables the idle timeout.
    int user_silence_timeout_ms = 60000;

    static SegmentConfig from_config(const Config& config);
};

struct SegmentEvent {
    enum class Kind {
        SpeechStarted,
        SpeechContinuing,
        UtteranceReady,
        UtteranceDiscarded,
        Timeout
    };

    Kind kind;
    std::optional<audio::Utterance> utterance;
};

const char* to_string(SegmentEvent::Kind kind);

class SegmentBuffer {
public:
    SegmentBuffer(SegmentConfig config,
                  std::unique_ptr<vad::VoiceActivityDetector> detector,
                  std::string call_id = {});

    std::optional<SegmentEvent> push(const audio::AudioFrame& frame);
    void reset();
    void restart_silence_timer();

    bool listening() const { return listening_; }
    uint64_t dropped_frames() const { return dropped_frames_; }
    size_t buffered_frames() const;
    const SegmentConfig& config() const { return config_; }

private:
    std::optional<SegmentEvent> push_idle(const audio::AudioFrame& frame, bool speech);
    std::optional<SegmentEvent> push_listening(const audio::AudioFrame& frame, bool speech);
    SegmentEvent open_utterance();
    SegmentEvent close_utterance(bool forced);
    void add_pre_roll(audio::AudioFrame frame);

    SegmentConfig config_;
    std::unique_ptr<vad::VoiceActivityDetector> detector_;
    std::string call_id_;

    bool listening_ = false;
    std::deque<audio::AudioFrame> pre_roll_;
    std::vector<audio::AudioFrame> speech_run_;

    std::vector<audio::AudioFrame> utterance_;
    int utterance_ms_ = 0;
    int voiced_ms_ = 0;
    int silence_run_ = 0;

    std::optional<uint64_t> last_sequence_;
    uint64_t dropped_frames_ = 0;
    int idle_ms_ = 0;
    bool timeout_fired_ = false;
};

}
