#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voice_bridge {

class Metrics {
public:
    static Metrics& instance();

    void increment(const std::string& event, uint64_t amount = 1);
    void set_active_sessions(size_t count);
    void observe_stage_latency(const std::string& stage, double seconds);
    uint64_t counter(const std::string& event) const;
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& stage);

    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> counters_;
    std::map<std::string, HistogramSeries> stage_histograms_;
    std::vector<double> histogram_bounds_;
    size_t active_sessions_ = 0;
};

}
