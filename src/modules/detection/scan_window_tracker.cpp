#include "modules/detection/scan_window_tracker.hpp"
#include <algorithm>
#include <set>

namespace sovereign_defense {
namespace detection {

using event_management::SecurityEvent;
using event_management::SecurityEventKind;
using logging::LogLevel;

ScanWindowTracker::ScanWindowTracker(const config::DetectionConfig& config,
                                     std::shared_ptr<logging::LoggingModule> logging_module,
                                     size_t shard_count)
    : window_(config.scan_window)
    , port_threshold_(config.scan_port_threshold)
    , logging_module_(std::move(logging_module))
    , windows_(shard_count) {}

void ScanWindowTracker::evictBefore(SourceWindow& window, TimePoint cutoff) const {
    auto end = window.entries.lower_bound(cutoff);
    for (auto it = window.entries.begin(); it != end; ++it) {
        auto count = window.port_counts.find(it->second);
        if (count != window.port_counts.end() && --count->second == 0) {
            window.port_counts.erase(count);
        }
    }
    window.entries.erase(window.entries.begin(), end);
}

std::optional<SecurityEvent> ScanWindowTracker::observe(const event_management::NetworkEvent& event) {
    bool stale = false;

    auto result = windows_.withEntry(event.source, [&](SourceWindow& window) -> std::optional<SecurityEvent> {
        evictBefore(window, event.timestamp - window_);

        if (!window.entries.empty() && event.timestamp < window.entries.begin()->first) {
            stale = true;
            return std::nullopt;
        }

        window.entries.emplace(event.timestamp, event.destination_port);
        ++window.port_counts[event.destination_port];
        window.latest = std::max(window.latest, event.timestamp);

        if (window.port_counts.size() < port_threshold_) {
            return std::nullopt;
        }
        if (window.cooldown_until && event.timestamp < *window.cooldown_until) {
            return std::nullopt;
        }

        window.cooldown_until = event.timestamp + window_;
        return buildEvent(event, window);
    });

    if (stale) {
        ++dropped_stale_;
        if (logging_module_) {
            logging_module_->log(LogLevel::DEBUG, "ScanWindowTracker", "observe",
                                 "Dropped event older than the retained window: " + event.source.key(),
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
    }

    if (result && logging_module_) {
        logging_module_->log(LogLevel::INFO, "ScanWindowTracker", "observe",
                             "Port scan detected from " + event.source.getValue(),
                             __FILE__, __FUNCTION__, std::to_string(__LINE__), result->getPayload());
    }
    return result;
}

SecurityEvent ScanWindowTracker::buildEvent(const event_management::NetworkEvent& event,
                                            const SourceWindow& window) const {
    std::set<uint16_t> ports;
    for (const auto& count : window.port_counts) {
        ports.insert(count.first);
    }

    double window_seconds = static_cast<double>(window_.count());
    double rate = static_cast<double>(ports.size()) / window_seconds;
    double threshold_rate = static_cast<double>(port_threshold_) / window_seconds;
    // Reaching the threshold scores 0.5, twice the threshold rate saturates
    double score = std::min(1.0, 0.5 * rate / threshold_rate);

    nlohmann::json payload;
    payload["distinct_ports"] = ports.size();
    payload["ports"] = std::vector<uint16_t>(ports.begin(), ports.end());
    payload["window_seconds"] = window_.count();
    payload["threshold"] = port_threshold_;
    payload["rate_per_second"] = rate;
    payload["first_seen"] = event_management::toMillis(window.entries.begin()->first);
    payload["last_seen"] = event_management::toMillis(window.latest);
    payload["protocol"] = event_management::protocolToString(event.protocol);

    return SecurityEvent(SecurityEventKind::PORT_SCAN,
                         event.source,
                         event_management::severityForScore(score),
                         score,
                         payload,
                         event.timestamp);
}

size_t ScanWindowTracker::sweep(TimePoint now) {
    return windows_.eraseIf([&](const event_management::SourceIdentity&, const SourceWindow& window) {
        bool idle = window.latest + window_ <= now;
        bool cooled = !window.cooldown_until || *window.cooldown_until <= now;
        return idle && cooled;
    });
}

} // namespace detection
} // namespace sovereign_defense
