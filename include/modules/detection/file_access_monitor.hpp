#pragma once

#include "modules/config/defense_config.hpp"
#include "modules/event_management/observation.hpp"
#include "modules/event_management/security_event.hpp"
#include "modules/event_management/sharded_map.hpp"
#include "modules/logging/logging_module.hpp"
#include <vector>
#include <memory>
#include <optional>
#include <unordered_map>
#include <atomic>

namespace sovereign_defense {
namespace detection {

/**
 * @brief Severity implied by the access kind alone
 *
 * read = low, execute = medium, write = high, delete = critical
 */
event_management::SeverityLevel accessKindSeverity(event_management::FileAccessKind kind);

/**
 * @brief Matches file accesses against sensitive path rules
 *
 * Only rule hits produce events; benign accesses are not recorded.
 */
class FileAccessMonitor {
public:
    FileAccessMonitor(const config::DetectionConfig& config,
                      std::shared_ptr<logging::LoggingModule> logging_module = nullptr,
                      size_t shard_count = 16);

    /**
     * @brief Highest severity rule matching the access, if any
     */
    std::optional<config::FileSensitivityRule> matchRule(const event_management::FileAccessEvent& event) const;

    /**
     * @return SENSITIVE_FILE_ACCESS event of severity max(rule minimum, access kind)
     *         unless an identical hit was reported within the dedup window
     */
    std::optional<event_management::SecurityEvent> observe(const event_management::FileAccessEvent& event);

    size_t sweep(event_management::TimePoint now);

    size_t ruleCount() const { return rules_.size(); }
    uint64_t suppressedDuplicates() const { return suppressed_.load(); }

private:
    using DedupTable = std::unordered_map<std::string, event_management::TimePoint>;

    static bool matches(const config::FileSensitivityRule& rule, const std::string& path);

    std::vector<config::FileSensitivityRule> rules_;
    std::chrono::seconds dedup_window_;
    std::shared_ptr<logging::LoggingModule> logging_module_;
    event_management::ShardedMap<DedupTable> recent_;
    std::atomic<uint64_t> suppressed_{0};
};

} // namespace detection
} // namespace sovereign_defense
