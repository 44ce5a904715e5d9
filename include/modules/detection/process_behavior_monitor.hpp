#pragma once

#include "modules/config/defense_config.hpp"
#include "modules/detection/baseline_scorer.hpp"
#include "modules/event_management/observation.hpp"
#include "modules/event_management/security_event.hpp"
#include "modules/event_management/sharded_map.hpp"
#include "modules/logging/logging_module.hpp"
#include <memory>
#include <optional>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace sovereign_defense {
namespace detection {

/**
 * @brief Flags processes whose footprint leaves their baseline
 *
 * The monitor learns for process_learning_period after its first
 * observation. Afterwards each observation is scored by the BaselineScorer;
 * executables seen for the first time are scored against the global default
 * baseline. Samples judged anomalous are not learned. Known suspicious tool
 * names are flagged regardless of the baseline.
 */
class ProcessBehaviorMonitor {
public:
    ProcessBehaviorMonitor(const config::DetectionConfig& config,
                           std::shared_ptr<BaselineScorer> scorer,
                           std::shared_ptr<logging::LoggingModule> logging_module = nullptr,
                           size_t shard_count = 16);

    /**
     * @return PROCESS_ANOMALY event for the first anomalous (or suspicious)
     *         reading of a pid; further readings of that pid stay quiet until it
     *         returns to normal
     */
    std::optional<event_management::SecurityEvent> observe(const event_management::ProcessObservation& observation);

    bool isLearning(event_management::TimePoint now) const;

    /**
     * @brief Drops pids silent for process_pid_idle_timeout, then executables
     *        with no pid left or idle for a learning period
     *
     * @return Number of executables dropped
     */
    size_t sweep(event_management::TimePoint now);

    size_t trackedPidCount();

    bool isSuspiciousName(const std::string& executable_path) const;
    bool isExcluded(const std::string& executable_path) const;

private:
    struct PidState {
        event_management::TimePoint last_seen{};
        int parent_pid = 0;
        size_t consecutive_anomalies = 0;
        bool flagged = false;
        bool suspicious_reported = false;
    };

    struct ExecutableTrack {
        event_management::TimePoint last_seen{};
        std::unordered_map<int, PidState> pids;
    };

    bool isReusedPid(const PidState& state, const event_management::ProcessObservation& observation) const;
    event_management::SecurityEvent buildAnomaly(const event_management::ProcessObservation& observation,
                                                 const BaselineScore& score) const;
    event_management::SecurityEvent buildSuspicious(const event_management::ProcessObservation& observation) const;

    std::chrono::seconds learning_period_;
    std::chrono::seconds pid_idle_timeout_;
    double sensitivity_;
    size_t consecutive_readings_;
    std::unordered_set<std::string> suspicious_names_;
    std::unordered_set<std::string> excluded_;
    std::shared_ptr<BaselineScorer> scorer_;
    std::shared_ptr<logging::LoggingModule> logging_module_;

    mutable std::mutex learning_mutex_;
    std::optional<event_management::TimePoint> learning_started_;

    event_management::ShardedMap<ExecutableTrack> tracks_;
};

} // namespace detection
} // namespace sovereign_defense
