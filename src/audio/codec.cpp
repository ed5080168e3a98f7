#include "voice_bridge/audio/codec.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "voice_bridge/audio/wav.hpp"
#include "voice_bridge/errors.hpp"
#include "voice_bridge/utils/base64.hpp"

namespace voice_bridge::audio {

namespace {

constexpr int kMulawBias = 0x84;
constexpr int kMulawClip = 32635;

}

Encoding parse_encoding(const std::string& value) {
    std::string normalized = value;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (normalized == "mulaw" || normalized == "ulaw" || normalized == "audio/x-mulaw") {
        return Encoding::Mulaw;
    }
    if (normalized == "l16" || normalized == "pcm16" || normalized == "linear16") {
        return Encoding::Linear16;
    }
    throw std::invalid_argument("unsupported audio encoding: " + value);
}

const char* to_string(Encoding encoding) {
    switch (encoding) {
        case Encoding::Mulaw:
            return "mulaw";
        case Encoding::Linear16:
            return "l16";
    }
    return "unknown";
}

int16_t mulaw_to_linear(uint8_t value) {
    const int inverted = ~value & 0xFF;
    const int sign = inverted & 0x80;
    const int exponent = (inverted >> 4) & 0x07;
    const int mantissa = inverted & 0x0F;
    int sample = ((mantissa << 3) + kMulawBias) << exponent;
    sample -= kMulawBias;
    return static_cast<int16_t>(sign ? -sample : sample);
}

uint8_t linear_to_mulaw(int16_t sample) {
    int pcm = sample;
    const int sign = pcm < 0 ? 0x80 : 0x00;
    if (pcm < 0) {
        pcm = -pcm;
    }
    pcm = std::min(pcm, kMulawClip);
    pcm += kMulawBias;

    int exponent = 7;
    for (int mask = 0x4000; (pcm & mask) == 0 && exponent > 0; mask >>= 1) {
        --exponent;
    }
    const int mantissa = (pcm >> (exponent + 3)) & 0x0F;
    return static_cast<uint8_t>(~(sign | (exponent << 4) | mantissa) & 0xFF);
}

AudioFrameDecoder::AudioFrameDecoder(Encoding encoding, int sample_rate)
    : encoding_(encoding),
      sample_rate_(sample_rate) {
    if (sample_rate_ <= 0) {
        throw std::invalid_argument("sample rate must be positive");
    }
}

AudioFrame AudioFrameDecoder::decode(const std::string& payload_b64, uint64_t sequence) const {
    if (payload_b64.empty()) {
        throw MalformedFrameError("empty media payload");
    }
    auto bytes = utils::base64_decode(payload_b64);
    if (!bytes) {
        throw MalformedFrameError("media payload is not valid base64");
    }
    if (bytes->empty()) {
        throw MalformedFrameError("media payload decodes to no audio");
    }
    AudioFrame frame;
    frame.sequence = sequence;
    frame.sample_rate = sample_rate_;
    frame.samples = decode_bytes(*bytes);
    return frame;
}

Samples AudioFrameDecoder::decode_bytes(const std::vector<uint8_t>& bytes) const {
    Samples samples;
    if (encoding_ == Encoding::Mulaw) {
        samples.reserve(bytes.size());
        for (uint8_t byte : bytes) {
            samples.push_back(mulaw_to_linear(byte));
        }
        return samples;
    }
    if (bytes.size() % 2 != 0) {
        throw MalformedFrameError("l16 payload has an odd byte count");
    }
    return pcm16_from_bytes(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

OutboundEncoder::OutboundEncoder(Encoding encoding, int sample_rate)
    : encoding_(encoding),
      sample_rate_(sample_rate) {}

std::string OutboundEncoder::encode(const AudioChunk& chunk) const {
    const auto samples = chunk.sample_rate == sample_rate_
                             ? chunk.samples
                             : resample_linear(chunk.samples, chunk.sample_rate, sample_rate_);
    return utils::base64_encode(encode_samples(samples));
}

std::vector<uint8_t> OutboundEncoder::encode_samples(const Samples& samples) const {
    std::vector<uint8_t> bytes;
    if (encoding_ == Encoding::Mulaw) {
        bytes.reserve(samples.size());
        for (int16_t sample : samples) {
            bytes.push_back(linear_to_mulaw(sample));
        }
        return bytes;
    }
    bytes.reserve(samples.size() * 2);
    for (int16_t sample : samples) {
        const auto value = static_cast<uint16_t>(sample);
        bytes.push_back(static_cast<uint8_t>(value & 0xFF));
        bytes.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    }
    return bytes;
}

}
