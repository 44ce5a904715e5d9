#include "modules/pipeline/defense_pipeline.hpp"
#include <algorithm>
#include <functional>
#include <stdexcept>

namespace sovereign_defense {
namespace pipeline {

using event_management::Observation;
using event_management::ObservationType;
using event_management::SecurityEvent;
using event_management::SeverityLevel;
using logging::LogLevel;

namespace {

const size_t kObservationTypes = 3;

size_t typeIndex(ObservationType type) {
    return static_cast<size_t>(type);
}

} // namespace

DefensePipeline::DefensePipeline(const config::DefenseConfig& config,
                                 std::shared_ptr<evidence::EvidenceLedger> ledger,
                                 std::shared_ptr<response::EnforcementGateway> gateway,
                                 std::shared_ptr<logging::LoggingModule> logging_module,
                                 std::shared_ptr<detection::BaselineScorer> scorer)
    : config_(config)
    , ledger_(std::move(ledger))
    , logging_module_(logging_module)
    , scan_tracker_(config.detection, logging_module, config.decision.shard_count)
    , connection_evaluator_(config.detection, logging_module, config.decision.shard_count)
    , process_monitor_(config.detection, std::move(scorer), logging_module, config.decision.shard_count)
    , file_monitor_(config.detection, logging_module, config.decision.shard_count)
    , decision_engine_(config.decision, logging_module)
    , enforcement_(std::move(gateway), config.enforcement, logging_module)
    , alerts_(config.alerting, logging_module)
    , ledger_queue_(config.pipeline.ledger_queue_size) {
    if (!ledger_) {
        throw std::invalid_argument("Defense pipeline requires an evidence ledger");
    }

    for (size_t i = 0; i < kObservationTypes; ++i) {
        ingest_queues_.push_back(std::make_unique<ObservationQueue>(config_.pipeline.ingest_queue_size));
    }
    size_t worker_count = std::max<size_t>(config_.pipeline.worker_count, 1);
    for (size_t i = 0; i < worker_count; ++i) {
        worker_queues_.push_back(std::make_unique<ObservationQueue>(config_.pipeline.worker_queue_size));
    }

    enforcement_.setAlertHandler([this](const std::string& reason, const decision::EnforcementAction& action) {
        alerts_.notify(alerting::AlertRequest::system(SeverityLevel::HIGH, reason, action.toJson()));
    });
}

DefensePipeline::~DefensePipeline() {
    stop();
}

void DefensePipeline::addAlertSink(std::shared_ptr<alerting::AlertSink> sink) {
    alerts_.addSink(std::move(sink));
}

void DefensePipeline::start() {
    if (running_) {
        return;
    }

    if (config_.evidence.verify_on_startup && ledger_->size() > 0) {
        auto result = ledger_->verifyChain();
        if (!result.intact) {
            haltIngestion("ledger verification failed at record " +
                          std::to_string(result.first_broken_sequence.value_or(0)) + ": " + result.reason);
        } else if (logging_module_) {
            logging_module_->log(LogLevel::INFO, "DefensePipeline", "start",
                                 "Evidence ledger intact, " + std::to_string(result.records_checked) + " records",
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
    }
    if (ledger_->isHalted() && !halted_) {
        haltIngestion(ledger_->haltReason());
    }

    running_ = true;
    stopping_ = false;
    accepting_ = !halted_;

    alerts_.start();
    enforcement_.start();
    if (!halted_) {
        restoreFromLedger();
    }

    ledger_writer_ = std::make_unique<std::thread>(&DefensePipeline::ledgerLoop, this);
    for (auto& queue : worker_queues_) {
        workers_.emplace_back(&DefensePipeline::workerLoop, this, std::ref(*queue));
    }
    for (auto& queue : ingest_queues_) {
        routers_.emplace_back(&DefensePipeline::routerLoop, this, std::ref(*queue));
    }
    sweeper_ = std::make_unique<std::thread>(&DefensePipeline::sweepLoop, this);

    if (logging_module_) {
        logging_module_->log(LogLevel::INFO, "DefensePipeline", "start",
                             "Pipeline started with " + std::to_string(workers_.size()) + " workers",
                             __FILE__, __FUNCTION__, std::to_string(__LINE__));
    }
}

void DefensePipeline::restoreFromLedger() {
    if (ledger_->size() == 0) {
        return;
    }

    const auto now = event_management::Clock::now();
    evidence::EvidenceQuery query;
    query.from_time = now - config_.decision.recidivism_retention_period;

    size_t replayed = 0;
    try {
        auto cursor = ledger_->query(query);
        while (auto record = cursor.next()) {
            decision_engine_.replay(*record);
            ++replayed;
        }
    } catch (const evidence::LedgerError& e) {
        haltIngestion(std::string("ledger replay failed: ") + e.what());
        return;
    }

    auto actions = decision_engine_.resumeEnforcement(now);
    for (const auto& action : actions) {
        enforcement_.submit(action);
    }

    if (logging_module_) {
        logging_module_->log(LogLevel::INFO, "DefensePipeline", "restoreFromLedger",
                             "Replayed " + std::to_string(replayed) + " records, " +
                             std::to_string(decision_engine_.trackedSources()) + " sources tracked",
                             __FILE__, __FUNCTION__, std::to_string(__LINE__),
                             nlohmann::json{{"enforcement_actions", actions.size()}});
    }
}

void DefensePipeline::stop() {
    if (!running_) {
        return;
    }
    accepting_ = false;

    // Drain stage by stage so nothing accepted is lost
    for (auto& queue : ingest_queues_) {
        queue->close();
    }
    for (auto& router : routers_) {
        router.join();
    }
    routers_.clear();

    for (auto& queue : worker_queues_) {
        queue->close();
    }
    for (auto& worker : workers_) {
        worker.join();
    }
    workers_.clear();

    ledger_queue_.close();
    if (ledger_writer_ && ledger_writer_->joinable()) {
        ledger_writer_->join();
    }
    ledger_writer_.reset();

    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        stopping_ = true;
    }
    sweep_cv_.notify_all();
    if (sweeper_ && sweeper_->joinable()) {
        sweeper_->join();
    }
    sweeper_.reset();

    try {
        ledger_->flush();
    } catch (const evidence::LedgerError& e) {
        haltIngestion(e.what());
    }

    enforcement_.stop();
    alerts_.stop();
    running_ = false;

    if (logging_module_) {
        logging_module_->log(LogLevel::INFO, "DefensePipeline", "stop", "Pipeline stopped",
                             __FILE__, __FUNCTION__, std::to_string(__LINE__), status().toJson());
    }
}

bool DefensePipeline::submit(const Observation& observation) {
    if (!accepting_) {
        return false;
    }

    if (auto reason = event_management::validateObservation(observation)) {
        ++observations_rejected_;
        if (logging_module_) {
            logging_module_->log(LogLevel::DEBUG, "DefensePipeline", "submit",
                                 "Rejected observation: " + *reason,
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
        return false;
    }

    auto& queue = *ingest_queues_[typeIndex(event_management::observationType(observation))];
    if (!queue.push(observation)) {
        return false;
    }
    ++observations_accepted_;
    return true;
}

void DefensePipeline::routerLoop(ObservationQueue& ingest) {
    std::hash<event_management::SourceIdentity> hasher;
    while (auto observation = ingest.pop()) {
        size_t index = hasher(event_management::observationSource(*observation)) % worker_queues_.size();
        worker_queues_[index]->push(std::move(*observation));
    }
}

void DefensePipeline::workerLoop(ObservationQueue& queue) {
    while (auto observation = queue.pop()) {
        try {
            detect(*observation);
        } catch (const std::exception& e) {
            ++detector_errors_;
            if (logging_module_) {
                logging_module_->log(LogLevel::ERROR, "DefensePipeline", "workerLoop",
                                     std::string("Detector failed: ") + e.what(),
                                     __FILE__, __FUNCTION__, std::to_string(__LINE__),
                                     event_management::observationToJson(*observation));
            }
        }
    }
}

void DefensePipeline::detect(const Observation& observation) {
    if (const auto* network = std::get_if<event_management::NetworkEvent>(&observation)) {
        if (auto event = scan_tracker_.observe(*network)) {
            emit(std::move(*event));
        }
        if (auto event = connection_evaluator_.evaluate(*network)) {
            emit(std::move(*event));
        }
    } else if (const auto* process = std::get_if<event_management::ProcessObservation>(&observation)) {
        if (auto event = process_monitor_.observe(*process)) {
            emit(std::move(*event));
        }
    } else if (const auto* file = std::get_if<event_management::FileAccessEvent>(&observation)) {
        if (auto event = file_monitor_.observe(*file)) {
            emit(std::move(*event));
        }
    }
}

void DefensePipeline::emit(SecurityEvent event) {
    ++events_emitted_;
    if (!ledger_queue_.push(std::move(event))) {
        ++events_discarded_;
    }
}

void DefensePipeline::ledgerLoop() {
    while (auto event = ledger_queue_.pop()) {
        commit(*event);
    }
}

void DefensePipeline::commit(const SecurityEvent& event) {
    if (halted_) {
        ++events_discarded_;
        return;
    }

    std::optional<evidence::EvidenceRecord> record;
    try {
        record = ledger_->append(event);
    } catch (const evidence::LedgerError& e) {
        ++events_discarded_;
        haltIngestion(e.what());
        return;
    }
    ++records_committed_;

    alerts_.notify(alerting::AlertRequest::fromEvent(event, record->sequence));
    dispatch(decision_engine_.onEvidence(*record));
}

void DefensePipeline::dispatch(const std::vector<decision::EnforcementAction>& actions) {
    for (const auto& action : actions) {
        enforcement_.submit(action);
        alerts_.notify(alerting::AlertRequest::fromAction(action));
    }
}

void DefensePipeline::sweepLoop() {
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (!stopping_) {
        sweep_cv_.wait_for(lock, config_.pipeline.sweep_interval, [this]() { return stopping_; });
        if (stopping_) {
            break;
        }
        lock.unlock();
        sweep(event_management::Clock::now());
        lock.lock();
    }
}

void DefensePipeline::sweep(event_management::TimePoint now) {
    scan_tracker_.sweep(now);
    connection_evaluator_.sweep(now);
    process_monitor_.sweep(now);
    file_monitor_.sweep(now);
    dispatch(decision_engine_.sweep(now));
}

std::optional<decision::EnforcementAction> DefensePipeline::release(const event_management::SourceIdentity& source) {
    auto action = decision_engine_.release(source, event_management::Clock::now());
    if (action) {
        dispatch({*action});
    }
    return action;
}

void DefensePipeline::haltIngestion(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(halt_mutex_);
        if (halted_) {
            return;
        }
        halt_reason_ = reason;
        halted_ = true;
    }
    accepting_ = false;
    ledger_->halt(reason);

    if (logging_module_) {
        logging_module_->log(LogLevel::CRITICAL, "DefensePipeline", "haltIngestion",
                             "Ingestion halted: " + reason,
                             __FILE__, __FUNCTION__, std::to_string(__LINE__));
    }
    alerts_.notify(alerting::AlertRequest::system(SeverityLevel::CRITICAL, "ledger_halted",
                                                  nlohmann::json{{"reason", reason},
                                                                 {"committed_records", ledger_->size()}}));
}

PipelineStatus DefensePipeline::status() const {
    PipelineStatus status;
    status.observations_accepted = observations_accepted_;
    status.observations_rejected = observations_rejected_;
    status.detector_errors = detector_errors_;
    status.events_emitted = events_emitted_;
    status.records_committed = records_committed_;
    status.events_discarded = events_discarded_;

    status.enforcement_completed = enforcement_.completedActions();
    status.enforcement_failed = enforcement_.failedActions();
    status.enforcement_dropped = enforcement_.droppedActions();
    status.enforcement_pending = enforcement_.pendingRetries();

    status.alerts_delivered = alerts_.deliveredAlerts();
    status.alert_failures = alerts_.failedDeliveries();
    status.alerts_dropped = alerts_.droppedAlerts();

    status.tracked_sources = decision_engine_.trackedSources();
    status.ledger_size = ledger_->size();

    if (halted_ || ledger_->isHalted()) {
        status.health = PipelineHealth::HALTED;
        std::lock_guard<std::mutex> lock(halt_mutex_);
        status.halt_reason = halt_reason_.empty() ? ledger_->haltReason() : halt_reason_;
    } else if (status.enforcement_pending > 0 || status.enforcement_dropped > 0 || status.alerts_dropped > 0) {
        status.health = PipelineHealth::DEGRADED;
    }
    return status;
}

} // namespace pipeline
} // namespace sovereign_defense
