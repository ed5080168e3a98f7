#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "voice_bridge/audio/frame.hpp"

namespace voice_bridge::audio {

std::string encode_wav(const Samples& samples, int sample_rate);

Samples resample_linear(const Samples& samples, int from_rate, int to_rate);

class StreamResampler {
public:
    StreamResampler(int from_rate, int to_rate);

    Samples process(const Samples& piece);

private:
    bool passthrough_;
    double step_;
    double position_ = 0.0;
    bool has_last_ = false;
    int16_t last_ = 0;
};

// Little-endian PCM16 bytes. A trailing odd byte is ignored.
Samples pcm16_from_bytes(const char* data, size_t size);

bool write_wav_file(const std::filesystem::path& path, const Samples& samples, int sample_rate);

float rms_level(const Samples& samples);

}
