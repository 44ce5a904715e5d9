#include "modules/detection/process_behavior_monitor.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace sovereign_defense {
namespace detection {

using event_management::ProcessObservation;
using event_management::SecurityEvent;
using event_management::SecurityEventKind;
using event_management::TimePoint;
using logging::LogLevel;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string executableName(const std::string& executable_path) {
    return lowercase(std::filesystem::path(executable_path).filename().string());
}

} // namespace

ProcessBehaviorMonitor::ProcessBehaviorMonitor(const config::DetectionConfig& config,
                                               std::shared_ptr<BaselineScorer> scorer,
                                               std::shared_ptr<logging::LoggingModule> logging_module,
                                               size_t shard_count)
    : learning_period_(config.process_learning_period)
    , pid_idle_timeout_(config.process_pid_idle_timeout)
    , sensitivity_(config.process_anomaly_sensitivity)
    , consecutive_readings_(std::max<size_t>(config.anomaly_consecutive_readings, 1))
    , scorer_(std::move(scorer))
    , logging_module_(std::move(logging_module))
    , tracks_(shard_count) {
    for (const auto& name : config.suspicious_process_names) {
        suspicious_names_.insert(lowercase(name));
    }
    for (const auto& executable : config.excluded_executables) {
        excluded_.insert(executable);
    }
    if (!scorer_) {
        scorer_ = std::make_shared<ZScoreBaselineScorer>(config);
    }
}

bool ProcessBehaviorMonitor::isSuspiciousName(const std::string& executable_path) const {
    std::string name = executableName(executable_path);
    if (suspicious_names_.count(name) > 0) {
        return true;
    }
    // "xmrig-6.21" or "nmap.exe" still count
    auto separator = name.find_first_of(".-_");
    return separator != std::string::npos && suspicious_names_.count(name.substr(0, separator)) > 0;
}

bool ProcessBehaviorMonitor::isExcluded(const std::string& executable_path) const {
    if (excluded_.count(executable_path) > 0) {
        return true;
    }
    return excluded_.count(std::filesystem::path(executable_path).filename().string()) > 0;
}

bool ProcessBehaviorMonitor::isReusedPid(const PidState& state, const ProcessObservation& observation) const {
    // Kernel recycled the pid for an unrelated process
    if (state.parent_pid != 0 && observation.parent_pid != 0 && state.parent_pid != observation.parent_pid) {
        return true;
    }
    return observation.timestamp > state.last_seen + pid_idle_timeout_;
}

bool ProcessBehaviorMonitor::isLearning(TimePoint now) const {
    std::lock_guard<std::mutex> lock(learning_mutex_);
    if (!learning_started_) {
        return learning_period_.count() > 0;
    }
    return now < *learning_started_ + learning_period_;
}

std::optional<SecurityEvent> ProcessBehaviorMonitor::observe(const ProcessObservation& observation) {
    if (isExcluded(observation.executable_path)) {
        return std::nullopt;
    }

    {
        std::lock_guard<std::mutex> lock(learning_mutex_);
        if (!learning_started_ || observation.timestamp < *learning_started_) {
            learning_started_ = observation.timestamp;
        }
    }
    const bool learning = isLearning(observation.timestamp);
    const bool suspicious = isSuspiciousName(observation.executable_path);

    auto result = tracks_.withEntry(observation.source(), [&](ExecutableTrack& track) -> std::optional<SecurityEvent> {
        track.last_seen = std::max(track.last_seen, observation.timestamp);
        auto found = track.pids.find(observation.pid);
        if (found != track.pids.end() && isReusedPid(found->second, observation)) {
            track.pids.erase(found);
            found = track.pids.end();
        }
        PidState& pid_state = found != track.pids.end() ? found->second : track.pids[observation.pid];
        pid_state.last_seen = std::max(pid_state.last_seen, observation.timestamp);
        if (observation.parent_pid != 0) {
            pid_state.parent_pid = observation.parent_pid;
        }

        if (suspicious) {
            if (pid_state.suspicious_reported) {
                return std::nullopt;
            }
            pid_state.suspicious_reported = true;
            return buildSuspicious(observation);
        }

        if (learning) {
            scorer_->learn(observation.executable_path, observation.footprint);
            return std::nullopt;
        }

        BaselineScore score = scorer_->score(observation.executable_path, observation.footprint);
        if (score.deviation <= sensitivity_) {
            pid_state.consecutive_anomalies = 0;
            pid_state.flagged = false;
            scorer_->learn(observation.executable_path, observation.footprint);
            return std::nullopt;
        }

        ++pid_state.consecutive_anomalies;
        if (pid_state.flagged || pid_state.consecutive_anomalies < consecutive_readings_) {
            return std::nullopt;
        }
        pid_state.flagged = true;
        return buildAnomaly(observation, score);
    });

    if (result && logging_module_) {
        logging_module_->log(LogLevel::INFO, "ProcessBehaviorMonitor", "observe",
                             "Process anomaly: " + observation.executable_path +
                             " (pid " + std::to_string(observation.pid) + ")",
                             __FILE__, __FUNCTION__, std::to_string(__LINE__), result->getPayload());
    }
    return result;
}

SecurityEvent ProcessBehaviorMonitor::buildAnomaly(const ProcessObservation& observation,
                                                   const BaselineScore& score) const {
    // Deviation at the sensitivity scores 0.3, four times the sensitivity saturates
    double normalized = 0.3 + 0.7 * (score.deviation - sensitivity_) / (3.0 * sensitivity_);
    normalized = std::min(1.0, std::max(0.3, normalized));

    nlohmann::json payload;
    payload["reason"] = "baseline_deviation";
    payload["pid"] = observation.pid;
    payload["parent_pid"] = observation.parent_pid;
    payload["user"] = observation.user;
    payload["metric"] = score.metric;
    payload["observed"] = score.observed;
    payload["expected"] = score.expected;
    payload["spread"] = score.spread;
    payload["deviation"] = score.deviation;
    payload["sensitivity"] = sensitivity_;
    payload["baseline"] = score.used_default ? "default" : "executable";
    payload["footprint"] = observation.footprint.toJson();

    return SecurityEvent(SecurityEventKind::PROCESS_ANOMALY,
                         observation.source(),
                         event_management::severityForScore(normalized),
                         normalized,
                         payload,
                         observation.timestamp);
}

SecurityEvent ProcessBehaviorMonitor::buildSuspicious(const ProcessObservation& observation) const {
    nlohmann::json payload;
    payload["reason"] = "suspicious_name";
    payload["name"] = executableName(observation.executable_path);
    payload["pid"] = observation.pid;
    payload["parent_pid"] = observation.parent_pid;
    payload["user"] = observation.user;
    payload["footprint"] = observation.footprint.toJson();

    return SecurityEvent(SecurityEventKind::PROCESS_ANOMALY,
                         observation.source(),
                         event_management::SeverityLevel::HIGH,
                         0.75,
                         payload,
                         observation.timestamp);
}

size_t ProcessBehaviorMonitor::sweep(TimePoint now) {
    tracks_.forEach([&](const event_management::SourceIdentity&, ExecutableTrack& track) {
        for (auto it = track.pids.begin(); it != track.pids.end();) {
            if (it->second.last_seen + pid_idle_timeout_ <= now) {
                it = track.pids.erase(it);
            } else {
                ++it;
            }
        }
    });

    auto idle_after = learning_period_.count() > 0 ? learning_period_ : std::chrono::seconds(3600);
    return tracks_.eraseIf([&](const event_management::SourceIdentity&, const ExecutableTrack& track) {
        return track.pids.empty() || track.last_seen + idle_after <= now;
    });
}

size_t ProcessBehaviorMonitor::trackedPidCount() {
    size_t count = 0;
    tracks_.forEach([&](const event_management::SourceIdentity&, ExecutableTrack& track) {
        count += track.pids.size();
    });
    return count;
}

} // namespace detection
} // namespace sovereign_defense
