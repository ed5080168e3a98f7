#include "voice_bridge/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace voice_bridge {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.05, 0.1, 0.25, 0.5, 0.75, 1.0, 1.5, 2.0,
                         3.0, 5.0, 7.5, 10.0, 20.0, 30.0};
}

void Metrics::increment(const std::string& event, uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[event] += amount;
}

void Metrics::set_active_sessions(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_sessions_ = count;
}

uint64_t Metrics::counter(const std::string& event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(event);
    return it == counters_.end() ? 0 : it->second;
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& stage) {
    auto& series = stage_histograms_[stage];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_stage_latency(const std::string& stage, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(stage);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP voice_bridge_active_sessions Calls currently in progress\n";
    out << "# TYPE voice_bridge_active_sessions gauge\n";
    out << "voice_bridge_active_sessions " << active_sessions_ << "\n";

    out << "# HELP voice_bridge_events_total Pipeline events by kind\n";
    out << "# TYPE voice_bridge_events_total counter\n";
    for (const auto& item : counters_) {
        out << "voice_bridge_events_total{event=\"" << item.first << "\"} "
            << item.second << "\n";
    }

    out << "# HELP voice_bridge_stage_seconds Latency of pipeline stages\n";
    out << "# TYPE voice_bridge_stage_seconds histogram\n";
    for (const auto& item : stage_histograms_) {
        const auto& stage = item.first;
        const auto& series = item.second;
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "voice_bridge_stage_seconds_bucket{stage=\"" << stage
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "voice_bridge_stage_seconds_bucket{stage=\"" << stage
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "voice_bridge_stage_seconds_count{stage=\"" << stage << "\"} "
            << series.count << "\n";
        out << "voice_bridge_stage_seconds_sum{stage=\"" << stage << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}
