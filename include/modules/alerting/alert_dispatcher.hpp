#pragma once

#include "modules/alerting/alert_request.hpp"
#include "modules/alerting/alert_sink.hpp"
#include "modules/config/defense_config.hpp"
#include "modules/event_management/bounded_queue.hpp"
#include "modules/logging/logging_module.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace sovereign_defense {
namespace alerting {

/**
 * @brief Fire-and-forget fan-out of alerts to every configured sink
 *
 * Alerts are queued (oldest dropped when full) and delivered on one worker
 * thread. Security event alerts below min_severity are filtered out;
 * enforcement and system alerts always pass. Sink failures are logged and
 * counted, never propagated.
 */
class AlertDispatcher {
public:
    AlertDispatcher(const config::AlertingConfig& config,
                    std::shared_ptr<logging::LoggingModule> logging_module = nullptr);
    ~AlertDispatcher();

    void addSink(std::shared_ptr<AlertSink> sink);
    size_t sinkCount() const;

    void start();

    /**
     * @brief Stops accepting alerts, delivers what is queued and joins the worker
     */
    void stop();

    /**
     * @return false if the alert was filtered or the dispatcher is stopped
     */
    bool notify(const AlertRequest& request);

    uint64_t deliveredAlerts() const { return delivered_; }
    uint64_t failedDeliveries() const { return failed_; }
    uint64_t droppedAlerts() const { return dropped_; }
    uint64_t filteredAlerts() const { return filtered_; }

private:
    void workerLoop();
    void deliver(const AlertRequest& request);

    config::AlertingConfig config_;
    std::shared_ptr<logging::LoggingModule> logging_module_;

    mutable std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<AlertSink>> sinks_;

    event_management::BoundedQueue<AlertRequest> queue_;
    std::unique_ptr<std::thread> worker_;

    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> filtered_{0};
};

/**
 * @brief Builds the sinks enabled in the alerting configuration
 */
std::vector<std::shared_ptr<AlertSink>> createAlertSinks(const config::AlertingConfig& config,
                                                         std::shared_ptr<logging::LoggingModule> logging_module);

} // namespace alerting
} // namespace sovereign_defense
