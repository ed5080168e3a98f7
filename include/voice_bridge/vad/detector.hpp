#pragma once

#include <deque>
#include <memory>
#include <vector>

#include "voice_bridge/audio/frame.hpp"

namespace voice_bridge {
struct Config;
}

namespace voice_bridge::vad {

class SileroModel;

class VoiceActivityDetector {
public:
    virtual ~VoiceActivityDetector() = default;

    virtual bool classify(const audio::AudioFrame& frame) = 0;
    virtual void reset() = 0;
};

struct EnergyDetectorConfig {
    float threshold = 0.02f;
    bool adaptive = true;
    float noise_alpha = 0.05f;
    float noise_multiplier = 3.0f;
};

class EnergyDetector : public VoiceActivityDetector {
public:
    explicit EnergyDetector(EnergyDetectorConfig config = {});

    bool classify(const audio::AudioFrame& frame) override;
    void reset() override;

    float noise_floor() const { return noise_floor_; }
    float effective_threshold() const;

private:
    EnergyDetectorConfig config_;
    float noise_floor_ = 0.0f;
    bool noise_initialized_ = false;
};

class SileroDetector : public VoiceActivityDetector {
public:
    SileroDetector(std::shared_ptr<SileroModel> model, float threshold, int prob_window = 3);

    bool classify(const audio::AudioFrame& frame) override;
    void reset() override;

    float last_probability() const { return last_prob_; }

private:
    float smoothed_prob(const std::vector<float>& window);

    std::shared_ptr<SileroModel> model_;
    float threshold_;
    size_t window_size_;
    int prob_window_;
    std::vector<float> buffer_;
    std::deque<float> prob_history_;
    std::vector<float> state_;
    float last_prob_ = 0.0f;
};

std::unique_ptr<VoiceActivityDetector> make_detector(const Config& config);

}
