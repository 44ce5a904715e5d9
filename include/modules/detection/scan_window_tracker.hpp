#pragma once

#include "modules/config/defense_config.hpp"
#include "modules/event_management/observation.hpp"
#include "modules/event_management/security_event.hpp"
#include "modules/event_management/sharded_map.hpp"
#include "modules/logging/logging_module.hpp"
#include <map>
#include <unordered_map>
#include <memory>
#include <optional>
#include <atomic>

namespace sovereign_defense {
namespace detection {

using event_management::TimePoint;

/**
 * @brief Per-source sliding window of touched destination ports
 *
 * Emits one PORT_SCAN event when a source touches at least
 * scan_port_threshold distinct ports within scan_window, then stays quiet
 * for one window length (cooldown) before it may emit again.
 */
class ScanWindowTracker {
public:
    ScanWindowTracker(const config::DetectionConfig& config,
                      std::shared_ptr<logging::LoggingModule> logging_module = nullptr,
                      size_t shard_count = 16);

    /**
     * @brief Feeds one network event into its source's window
     *
     * Eviction is keyed off the event's own timestamp. Events older than the
     * oldest retained entry of the window are dropped.
     *
     * @return PORT_SCAN event when the threshold is met outside cooldown
     */
    std::optional<event_management::SecurityEvent> observe(const event_management::NetworkEvent& event);

    /**
     * @brief Drops sources whose window has gone idle and whose cooldown elapsed
     *
     * @return Number of sources removed
     */
    size_t sweep(TimePoint now);

    size_t trackedSources() const { return windows_.size(); }
    uint64_t droppedStaleEvents() const { return dropped_stale_.load(); }

private:
    struct SourceWindow {
        std::multimap<TimePoint, uint16_t> entries;
        std::unordered_map<uint16_t, size_t> port_counts;
        TimePoint latest{};
        std::optional<TimePoint> cooldown_until;
    };

    void evictBefore(SourceWindow& window, TimePoint cutoff) const;
    event_management::SecurityEvent buildEvent(const event_management::NetworkEvent& event,
                                               const SourceWindow& window) const;

    std::chrono::seconds window_;
    size_t port_threshold_;
    std::shared_ptr<logging::LoggingModule> logging_module_;
    event_management::ShardedMap<SourceWindow> windows_;
    std::atomic<uint64_t> dropped_stale_{0};
};

} // namespace detection
} // namespace sovereign_defense
