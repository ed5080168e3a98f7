#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace voice_bridge::audio {

using Samples = std::vector<int16_t>;

struct AudioFrame {
    uint64_t sequence = 0;
    int sample_rate = 8000;
    Samples samples;

    int duration_ms() const {
        if (sample_rate <= 0) {
            return 0;
        }
        return static_cast<int>(samples.size() * 1000 / static_cast<std::size_t>(sample_rate));
    }
};

struct Utterance {
    std::vector<AudioFrame> frames;
    int sample_rate = 8000;
    // Duration of the frames the detector classified as speech.
    int voiced_ms = 0;

    int duration_ms() const {
        int total = 0;
        for (const auto& frame : frames) {
            total += frame.duration_ms();
        }
        return total;
    }

    Samples samples() const {
        Samples result;
        for (const auto& frame : frames) {
            result.insert(result.end(), frame.samples.begin(), frame.samples.end());
        }
        return result;
    }

    bool empty() const { return frames.empty(); }
};

struct AudioChunk {
    uint64_t generation = 0;
    int sample_rate = 8000;
    Samples samples;
};

}
