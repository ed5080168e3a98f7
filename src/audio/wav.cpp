#include "voice_bridge/audio/wav.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <system_error>

namespace voice_bridge::audio {

std::string encode_wav(const Samples& samples, int sample_rate) {
    const uint16_t channels = 1;
    const uint16_t bits_per_sample = 16;
    const auto rate = static_cast<uint32_t>(sample_rate);
    const uint16_t block_align = channels * (bits_per_sample / 8);
    const uint32_t byte_rate = rate * block_align;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    const uint32_t chunk_size = 36 + data_size;

    std::string result;
    result.reserve(44 + data_size);
    auto append = [&result](const void* data, size_t size) {
        result.append(static_cast<const char*>(data), size);
    };
    auto append_u16 = [&append](uint16_t value) {
        const uint8_t bytes[2] = {
            static_cast<uint8_t>(value & 0xFF),
            static_cast<uint8_t>((value >> 8) & 0xFF)
        };
        append(bytes, sizeof(bytes));
    };
    auto append_u32 = [&append](uint32_t value) {
        const uint8_t bytes[4] = {
            static_cast<uint8_t>(value & 0xFF),
            static_cast<uint8_t>((value >> 8) & 0xFF),
            static_cast<uint8_t>((value >> 16) & 0xFF),
            static_cast<uint8_t>((value >> 24) & 0xFF)
        };
        append(bytes, sizeof(bytes));
    };

    append("RIFF", 4);
    append_u32(chunk_size);
    append("WAVE", 4);
    append("fmt ", 4);
    append_u32(16);
    append_u16(1);
    append_u16(channels);
    append_u32(rate);
    append_u32(byte_rate);
    append_u16(block_align);
    append_u16(bits_per_sample);
    append("data", 4);
    append_u32(data_size);

    for (int16_t sample : samples) {
        append_u16(static_cast<uint16_t>(sample));
    }
    return result;
}

Samples resample_linear(const Samples& samples, int from_rate, int to_rate) {
    if (samples.empty() || from_rate <= 0 || to_rate <= 0 || from_rate == to_rate) {
        return samples;
    }
    const double ratio = static_cast<double>(from_rate) / static_cast<double>(to_rate);
    const auto out_size = static_cast<size_t>(
        std::llround(static_cast<double>(samples.size()) / ratio));
    Samples out;
    out.reserve(out_size);
    for (size_t i = 0; i < out_size; ++i) {
        const double position = static_cast<double>(i) * ratio;
        const auto index = static_cast<size_t>(position);
        if (index + 1 >= samples.size()) {
            out.push_back(samples.back());
            continue;
        }
        const double frac = position - static_cast<double>(index);
        const double value = samples[index] * (1.0 - frac) + samples[index + 1] * frac;
        out.push_back(static_cast<int16_t>(std::lround(value)));
    }
    return out;
}

StreamResampler::StreamResampler(int from_rate, int to_rate)
    : passthrough_(from_rate <= 0 || to_rate <= 0 || from_rate == to_rate),
      step_(passthrough_ ? 1.0 : static_cast<double>(from_rate) / static_cast<double>(to_rate)) {}

Samples StreamResampler::process(const Samples& piece) {
    if (passthrough_ || piece.empty()) {
        return piece;
    }
    Samples input;
    input.reserve(piece.size() + 1);
    if (has_last_) {
        input.push_back(last_);
    }
    input.insert(input.end(), piece.begin(), piece.end());

    Samples out;
    out.reserve(static_cast<size_t>(static_cast<double>(input.size()) / step_) + 1);
    while (position_ + 1.0 < static_cast<double>(input.size())) {
        const auto index = static_cast<size_t>(position_);
        const double frac = position_ - static_cast<double>(index);
        const double value = input[index] * (1.0 - frac) + input[index + 1] * frac;
        out.push_back(static_cast<int16_t>(std::lround(value)));
        position_ += step_;
    }
    position_ -= static_cast<double>(input.size() - 1);
    last_ = input.back();
    has_last_ = true;
    return out;
}

Samples pcm16_from_bytes(const char* data, size_t size) {
    Samples samples;
    samples.reserve(size / 2);
    for (size_t i = 0; i + 1 < size; i += 2) {
        const auto lo = static_cast<uint8_t>(data[i]);
        const auto hi = static_cast<uint8_t>(data[i + 1]);
        samples.push_back(static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8))));
    }
    return samples;
}

bool write_wav_file(const std::filesystem::path& path, const Samples& samples, int sample_rate) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        return false;
    }
    const auto wav = encode_wav(samples, sample_rate);
    out.write(wav.data(), static_cast<std::streamsize>(wav.size()));
    return static_cast<bool>(out);
}

float rms_level(const Samples& samples) {
    if (samples.empty()) {
        return 0.0f;
    }
    double sum = 0.0;
    for (int16_t sample : samples) {
        const double normalized = static_cast<double>(sample) / 32768.0;
        sum += normalized * normalized;
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(samples.size())));
}

}
