#include "modules/detection/baseline_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace sovereign_defense {
namespace detection {

void ZScoreBaselineScorer::RunningStat::add(double value, double max_weight) {
    if (count < max_weight) {
        count += 1.0;
    }
    double delta = value - mean;
    mean += delta / count;
    m2 += delta * (value - mean);
    if (count >= max_weight) {
        // Keep m2 consistent with the capped weight
        m2 *= (count - 1.0) / count;
    }
}

double ZScoreBaselineScorer::RunningStat::stddev() const {
    if (count < 2.0) {
        return 0.0;
    }
    return std::sqrt(m2 / (count - 1.0));
}

ZScoreBaselineScorer::ZScoreBaselineScorer(const config::DetectionConfig& config)
    : min_samples_(config.baseline_min_samples)
    , max_samples_(std::max(config.baseline_max_samples, config.baseline_min_samples))
    , min_stddev_(config.baseline_min_stddev)
    , max_executables_(std::max<size_t>(config.baseline_max_executables, 1))
    , default_baseline_(config.default_process_baseline) {}

void ZScoreBaselineScorer::learn(const std::string& executable, const event_management::ProcessFootprint& footprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (baselines_.size() >= max_executables_ && baselines_.find(executable) == baselines_.end()) {
        auto oldest = std::min_element(baselines_.begin(), baselines_.end(),
                                       [](const auto& left, const auto& right) {
                                           return left.second.last_learned < right.second.last_learned;
                                       });
        baselines_.erase(oldest);
    }
    auto& baseline = baselines_[executable];
    baseline.last_learned = ++learn_counter_;
    double max_weight = static_cast<double>(max_samples_);
    baseline.cpu.add(footprint.cpu_percent, max_weight);
    baseline.memory.add(footprint.memory_percent, max_weight);
    baseline.connections.add(footprint.connection_count, max_weight);
    baseline.threads.add(footprint.thread_count, max_weight);
    ++baseline.samples;
}

BaselineScore ZScoreBaselineScorer::score(const std::string& executable,
                                          const event_management::ProcessFootprint& footprint) const {
    struct Metric {
        const char* name;
        double observed;
        double expected;
        double spread;
    };

    std::vector<Metric> metrics;
    bool used_default = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = baselines_.find(executable);
        if (it != baselines_.end() && it->second.samples >= min_samples_) {
            const auto& baseline = it->second;
            used_default = false;
            metrics = {
                {"cpu_percent", footprint.cpu_percent, baseline.cpu.mean, baseline.cpu.stddev()},
                {"memory_percent", footprint.memory_percent, baseline.memory.mean, baseline.memory.stddev()},
                {"connection_count", footprint.connection_count, baseline.connections.mean, baseline.connections.stddev()},
                {"thread_count", footprint.thread_count, baseline.threads.mean, baseline.threads.stddev()}
            };
        }
    }

    if (used_default) {
        const auto& mean = default_baseline_.mean;
        const auto& stddev = default_baseline_.stddev;
        metrics = {
            {"cpu_percent", footprint.cpu_percent, mean.cpu_percent, stddev.cpu_percent},
            {"memory_percent", footprint.memory_percent, mean.memory_percent, stddev.memory_percent},
            {"connection_count", footprint.connection_count, mean.connection_count, stddev.connection_count},
            {"thread_count", footprint.thread_count, mean.thread_count, stddev.thread_count}
        };
    }

    BaselineScore result;
    result.used_default = used_default;
    for (const auto& metric : metrics) {
        double spread = std::max(metric.spread, min_stddev_);
        double deviation = std::fabs(metric.observed - metric.expected) / spread;
        if (result.metric.empty() || deviation > result.deviation) {
            result.deviation = deviation;
            result.metric = metric.name;
            result.observed = metric.observed;
            result.expected = metric.expected;
            result.spread = spread;
        }
    }
    return result;
}

size_t ZScoreBaselineScorer::sampleCount(const std::string& executable) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = baselines_.find(executable);
    return it == baselines_.end() ? 0 : it->second.samples;
}

size_t ZScoreBaselineScorer::executableCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return baselines_.size();
}

} // namespace detection
} // namespace sovereign_defense
