#include "voice_bridge/vad/detector.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <mutex>
#include <stdexcept>

#include "voice_bridge/adapters/http_client.hpp"
#include "voice_bridge/audio/wav.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/vad/model.hpp"

namespace voice_bridge::vad {

EnergyDetector::EnergyDetector(EnergyDetectorConfig config)
    : config_(config) {}

float EnergyDetector::effective_threshold() const {
    if (!config_.adaptive || !noise_initialized_) {
        return config_.threshold;
    }
    return std::max(config_.threshold, noise_floor_ * config_.noise_multiplier);
}

bool EnergyDetector::classify(const audio::AudioFrame& frame) {
    const float level = audio::rms_level(frame.samples);
    const bool speech = level > effective_threshold();
    if (!speech && config_.adaptive) {
        if (!noise_initialized_) {
            noise_floor_ = level;
            noise_initialized_ = true;
        } else {
            noise_floor_ += config_.noise_alpha * (level - noise_floor_);
        }
    }
    return speech;
}

void EnergyDetector::reset() {
    noise_floor_ = 0.0f;
    noise_initialized_ = false;
}

SileroDetector::SileroDetector(std::shared_ptr<SileroModel> model, float threshold, int prob_window)
    : model_(std::move(model)),
      threshold_(threshold),
      window_size_(model_ ? model_->window_size() : 512),
      prob_window_(std::max(1, prob_window)) {
    if (!model_) {
        throw std::invalid_argument("SileroDetector requires a model");
    }
    state_ = model_->initialize_state();
}

float SileroDetector::smoothed_prob(const std::vector<float>& window) {
    std::vector<float> normalized = window;
    float max_amp = 0.0f;
    for (auto val : normalized) {
        max_amp = std::max(max_amp, std::abs(val));
    }
    if (max_amp > 1.0f) {
        for (auto& val : normalized) {
            val /= max_amp;
        }
    }
    const float prob = model_->predict(normalized, &state_);
    prob_history_.push_back(prob);
    if (prob_history_.size() > static_cast<size_t>(prob_window_)) {
        prob_history_.pop_front();
    }
    // Newer windows weigh more.
    float weighted_sum = 0.0f;
    float weight_total = 0.0f;
    int weight = 1;
    for (const auto val : prob_history_) {
        weighted_sum += val * static_cast<float>(weight);
        weight_total += static_cast<float>(weight);
        ++weight;
    }
    return weighted_sum / weight_total;
}

bool SileroDetector::classify(const audio::AudioFrame& frame) {
    for (auto sample : frame.samples) {
        buffer_.push_back(static_cast<float>(sample) / 32768.0f);
    }
    while (buffer_.size() >= window_size_) {
        std::vector<float> window(buffer_.begin(), buffer_.begin() + window_size_);
        buffer_.erase(buffer_.begin(), buffer_.begin() + window_size_);
        last_prob_ = smoothed_prob(window);
    }
    return last_prob_ > threshold_;
}

void SileroDetector::reset() {
    buffer_.clear();
    prob_history_.clear();
    state_ = model_->initialize_state();
    last_prob_ = 0.0f;
}

namespace {

std::shared_ptr<SileroModel> shared_silero_model(const Config& config) {
    static std::mutex mutex;
    static std::shared_ptr<SileroModel> model;
    std::lock_guard<std::mutex> lock(mutex);
    if (model) {
        return model;
    }
    if (!std::filesystem::exists(config.vad_model_path)) {
        logging::info("Downloading VAD model",
                      {kv("url", config.vad_model_url),
                       kv("path", config.vad_model_path.string())});
        HttpRequestOptions options;
        options.connect_timeout = config.http_connect_timeout;
        options.read_timeout = config.http_read_timeout;
        HttpClient(config.vad_model_url, std::nullopt, options).download(config.vad_model_path);
    }
    model = std::make_shared<SileroModel>(config.vad_model_path, config.carrier_sample_rate);
    logging::info("VAD model loaded", {kv("path", config.vad_model_path.string())});
    return model;
}

}

std::unique_ptr<VoiceActivityDetector> make_detector(const Config& config) {
    if (config.vad_engine == "silero") {
        return std::make_unique<SileroDetector>(shared_silero_model(config),
                                                static_cast<float>(config.vad_threshold));
    }
    EnergyDetectorConfig energy;
    energy.threshold = static_cast<float>(config.vad_energy_threshold);
    energy.adaptive = config.vad_adaptive;
    return std::make_unique<EnergyDetector>(energy);
}

}
