#pragma once

#include "modules/alerting/alert_dispatcher.hpp"
#include "modules/config/defense_config.hpp"
#include "modules/decision/decision_engine.hpp"
#include "modules/detection/baseline_scorer.hpp"
#include "modules/detection/connection_policy_evaluator.hpp"
#include "modules/detection/file_access_monitor.hpp"
#include "modules/detection/process_behavior_monitor.hpp"
#include "modules/detection/scan_window_tracker.hpp"
#include "modules/event_management/bounded_queue.hpp"
#include "modules/event_management/observation.hpp"
#include "modules/evidence/evidence_ledger.hpp"
#include "modules/logging/logging_module.hpp"
#include "modules/pipeline/pipeline_status.hpp"
#include "modules/response/enforcement_dispatcher.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace sovereign_defense {
namespace pipeline {

/**
 * @brief Wires capture, detection, evidence, decision and enforcement together
 *
 * Observations enter per-type ingest queues (producers block when full).
 * One router per type forwards them to a worker chosen by source hash, so a
 * source's stream keeps its order and its detector state is only touched by
 * one worker at a time. Detected events go through an ordered queue to the
 * single ledger writer; only committed records reach the decision engine,
 * whose actions are handed to the asynchronous enforcement and alert
 * dispatchers. A ledger failure halts ingestion.
 */
class DefensePipeline {
public:
    DefensePipeline(const config::DefenseConfig& config,
                    std::shared_ptr<evidence::EvidenceLedger> ledger,
                    std::shared_ptr<response::EnforcementGateway> gateway,
                    std::shared_ptr<logging::LoggingModule> logging_module = nullptr,
                    std::shared_ptr<detection::BaselineScorer> scorer = nullptr);
    ~DefensePipeline();

    DefensePipeline(const DefensePipeline&) = delete;
    DefensePipeline& operator=(const DefensePipeline&) = delete;

    void addAlertSink(std::shared_ptr<alerting::AlertSink> sink);

    /**
     * @brief Verifies the ledger if configured, then starts every thread
     */
    void start();

    /**
     * @brief Graceful shutdown
     *
     * Stops accepting observations, drains detector work, commits pending
     * events, flushes the ledger and drains the dispatchers.
     */
    void stop();

    /**
     * @brief Validates and enqueues an observation
     *
     * @return false if the observation was rejected or ingestion is closed
     */
    bool submit(const event_management::Observation& observation);

    /**
     * @brief Operator release of a blocked source
     */
    std::optional<decision::EnforcementAction> release(const event_management::SourceIdentity& source);

    /**
     * @brief Runs every periodic sweep at the given time
     */
    void sweep(event_management::TimePoint now);

    PipelineStatus status() const;
    bool isRunning() const { return running_; }
    bool isHalted() const { return halted_.load(); }

    evidence::EvidenceLedger& ledger() { return *ledger_; }
    decision::DecisionEngine& decisionEngine() { return decision_engine_; }
    response::EnforcementDispatcher& enforcementDispatcher() { return enforcement_; }
    alerting::AlertDispatcher& alertDispatcher() { return alerts_; }

private:
    using ObservationQueue = event_management::BoundedQueue<event_management::Observation>;

    void routerLoop(ObservationQueue& ingest);
    void workerLoop(ObservationQueue& queue);
    void ledgerLoop();
    void sweepLoop();

    void detect(const event_management::Observation& observation);
    void emit(event_management::SecurityEvent event);
    void commit(const event_management::SecurityEvent& event);
    void dispatch(const std::vector<decision::EnforcementAction>& actions);
    void haltIngestion(const std::string& reason);
    void restoreFromLedger();

    config::DefenseConfig config_;
    std::shared_ptr<evidence::EvidenceLedger> ledger_;
    std::shared_ptr<logging::LoggingModule> logging_module_;

    detection::ScanWindowTracker scan_tracker_;
    detection::ConnectionPolicyEvaluator connection_evaluator_;
    detection::ProcessBehaviorMonitor process_monitor_;
    detection::FileAccessMonitor file_monitor_;
    decision::DecisionEngine decision_engine_;
    response::EnforcementDispatcher enforcement_;
    alerting::AlertDispatcher alerts_;

    // Indexed by ObservationType
    std::vector<std::unique_ptr<ObservationQueue>> ingest_queues_;
    std::vector<std::unique_ptr<ObservationQueue>> worker_queues_;
    event_management::BoundedQueue<event_management::SecurityEvent> ledger_queue_;

    std::vector<std::thread> routers_;
    std::vector<std::thread> workers_;
    std::unique_ptr<std::thread> ledger_writer_;
    std::unique_ptr<std::thread> sweeper_;

    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    bool stopping_ = false;
    bool running_ = false;

    std::atomic<bool> accepting_{false};
    std::atomic<bool> halted_{false};
    mutable std::mutex halt_mutex_;
    std::string halt_reason_;

    std::atomic<uint64_t> observations_accepted_{0};
    std::atomic<uint64_t> observations_rejected_{0};
    std::atomic<uint64_t> detector_errors_{0};
    std::atomic<uint64_t> events_emitted_{0};
    std::atomic<uint64_t> records_committed_{0};
    std::atomic<uint64_t> events_discarded_{0};
};

} // namespace pipeline
} // namespace sovereign_defense
