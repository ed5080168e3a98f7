#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "voice_bridge/audio/frame.hpp"

namespace voice_bridge::audio {

enum class Encoding {
    Mulaw,
    Linear16
};

Encoding parse_encoding(const std::string& value);
const char* to_string(Encoding encoding);

int16_t mulaw_to_linear(uint8_t value);
uint8_t linear_to_mulaw(int16_t sample);

class AudioFrameDecoder {
public:
    AudioFrameDecoder(Encoding encoding, int sample_rate);

    // Throws MalformedFrameError on undecodable input.
    AudioFrame decode(const std::string& payload_b64, uint64_t sequence) const;
    Samples decode_bytes(const std::vector<uint8_t>& bytes) const;

    Encoding encoding() const { return encoding_; }
    int sample_rate() const { return sample_rate_; }

private:
    Encoding encoding_;
    int sample_rate_;
};

class OutboundEncoder {
public:
    OutboundEncoder(Encoding encoding, int sample_rate);

    std::string encode(const AudioChunk& chunk) const;
    std::vector<uint8_t> encode_samples(const Samples& samples) const;

private:
    Encoding encoding_;
    int sample_rate_;
};

}
