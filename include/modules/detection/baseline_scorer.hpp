#pragma once

#include "modules/config/defense_config.hpp"
#include "modules/event_management/observation.hpp"
#include <string>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace sovereign_defense {
namespace detection {

/**
 * @brief Result of scoring one footprint against a baseline
 */
struct BaselineScore {
    // Largest per-metric deviation, in spreads from the expected value
    double deviation = 0.0;
    std::string metric;
    double observed = 0.0;
    double expected = 0.0;
    double spread = 0.0;
    // true when the global default baseline was used
    bool used_default = false;
};

/**
 * @brief Pluggable baseline model for process footprints
 *
 * Implementations must be safe to call from several detector workers at once.
 */
class BaselineScorer {
public:
    virtual ~BaselineScorer() = default;

    /**
     * @brief Adds a sample to the executable's baseline
     */
    virtual void learn(const std::string& executable, const event_management::ProcessFootprint& footprint) = 0;

    /**
     * @brief Scores a footprint; executables without a mature baseline use the default one
     */
    virtual BaselineScore score(const std::string& executable, const event_management::ProcessFootprint& footprint) const = 0;

    virtual size_t sampleCount(const std::string& executable) const = 0;
};

/**
 * @brief Rolling mean/variance baseline (Welford) scored in standard deviations
 *
 * The effective sample weight is capped at max_samples so that old
 * behaviour fades out and the baseline keeps following the executable.
 * At most baseline_max_executables baselines are kept; learning a new
 * executable beyond that evicts the least recently learned one.
 */
class ZScoreBaselineScorer : public BaselineScorer {
public:
    explicit ZScoreBaselineScorer(const config::DetectionConfig& config);

    void learn(const std::string& executable, const event_management::ProcessFootprint& footprint) override;
    BaselineScore score(const std::string& executable, const event_management::ProcessFootprint& footprint) const override;
    size_t sampleCount(const std::string& executable) const override;

    size_t executableCount() const;

private:
    struct RunningStat {
        double count = 0.0;
        double mean = 0.0;
        double m2 = 0.0;

        void add(double value, double max_weight);
        double stddev() const;
    };

    struct ExecutableBaseline {
        size_t samples = 0;
        uint64_t last_learned = 0;
        RunningStat cpu;
        RunningStat memory;
        RunningStat connections;
        RunningStat threads;
    };

    size_t min_samples_;
    size_t max_samples_;
    double min_stddev_;
    size_t max_executables_;
    config::DefaultProcessBaseline default_baseline_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ExecutableBaseline> baselines_;
    uint64_t learn_counter_ = 0;
};

} // namespace detection
} // namespace sovereign_defense
