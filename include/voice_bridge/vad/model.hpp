#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace voice_bridge {
namespace vad {

class SileroModel {
public:
    SileroModel(const std::filesystem::path& model_path, int sampling_rate);
    ~SileroModel();

    static bool available();

    int sampling_rate() const;
    size_t window_size() const;
    std::vector<float> initialize_state() const;
    float predict(const std::vector<float>& window, std::vector<float>* state) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
