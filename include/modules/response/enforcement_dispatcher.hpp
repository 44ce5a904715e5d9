#pragma once

#include "modules/config/defense_config.hpp"
#include "modules/decision/threat_state.hpp"
#include "modules/event_management/bounded_queue.hpp"
#include "modules/logging/logging_module.hpp"
#include "modules/response/enforcement_gateway.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

namespace sovereign_defense {
namespace response {

/**
 * @brief Asynchronous, retrying front end of the enforcement gateway
 *
 * Actions are queued (dropping the oldest when full) and executed on a
 * single worker thread, so decisions never wait for the firewall. Failed
 * calls are retried with exponential backoff; once retries are exhausted
 * the action is reported and kept as pending-retry, it is never abandoned.
 */
class EnforcementDispatcher {
public:
    /**
     * @brief Receives a reason ("enforcement_failed", "enforcement_dropped") and the action
     */
    using AlertHandler = std::function<void(const std::string&, const decision::EnforcementAction&)>;

    EnforcementDispatcher(std::shared_ptr<EnforcementGateway> gateway,
                          const config::EnforcementConfig& config,
                          std::shared_ptr<logging::LoggingModule> logging_module = nullptr);
    ~EnforcementDispatcher();

    void setAlertHandler(AlertHandler handler) { alert_handler_ = std::move(handler); }

    void start();

    /**
     * @brief Stops accepting actions, drains the queue and joins the worker
     *
     * Backoff waits are cut short; unfinished actions stay pending.
     */
    void stop();

    /**
     * @brief Queues an action
     *
     * @return false once the dispatcher is stopped
     */
    bool submit(const decision::EnforcementAction& action);

    /**
     * @brief Retries every pending action once
     */
    void retryPending();

    bool isEnforced(const event_management::SourceIdentity& source) const;

    size_t pendingRetries() const;
    size_t queuedActions() const { return queue_.size(); }
    uint64_t droppedActions() const { return dropped_; }
    uint64_t failedActions() const { return failed_; }
    uint64_t skippedDuplicates() const { return skipped_; }
    uint64_t completedActions() const { return completed_; }

private:
    void workerLoop();
    void process(const decision::EnforcementAction& action);
    bool attempt(const decision::EnforcementAction& action);
    bool call(const decision::EnforcementAction& action);
    void raiseAlert(const std::string& reason, const decision::EnforcementAction& action);

    std::shared_ptr<EnforcementGateway> gateway_;
    config::EnforcementConfig config_;
    std::shared_ptr<logging::LoggingModule> logging_module_;
    AlertHandler alert_handler_;

    event_management::BoundedQueue<decision::EnforcementAction> queue_;
    std::unique_ptr<std::thread> worker_;

    // Identities the gateway has confirmed as blocked, and actions awaiting retry
    mutable std::mutex state_mutex_;
    std::unordered_set<event_management::SourceIdentity> enforced_;
    std::vector<decision::EnforcementAction> pending_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::atomic<bool> stopping_{false};
    bool running_ = false;

    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> completed_{0};
};

} // namespace response
} // namespace sovereign_defense
