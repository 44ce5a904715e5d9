#include "modules/response/enforcement_dispatcher.hpp"
#include <algorithm>
#include <stdexcept>

namespace sovereign_defense {
namespace response {

using decision::EnforcementAction;
using decision::EnforcementActionType;
using logging::LogLevel;

namespace {

const char* actionName(const EnforcementAction& action) {
    return action.type == EnforcementActionType::BLOCK ? "block" : "unblock";
}

} // namespace

EnforcementDispatcher::EnforcementDispatcher(std::shared_ptr<EnforcementGateway> gateway,
                                             const config::EnforcementConfig& config,
                                             std::shared_ptr<logging::LoggingModule> logging_module)
    : gateway_(std::move(gateway))
    , config_(config)
    , logging_module_(std::move(logging_module))
    , queue_(config.queue_size) {
    if (!gateway_) {
        throw std::invalid_argument("Enforcement dispatcher requires a gateway");
    }
}

EnforcementDispatcher::~EnforcementDispatcher() {
    stop();
}

void EnforcementDispatcher::start() {
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::make_unique<std::thread>(&EnforcementDispatcher::workerLoop, this);
}

void EnforcementDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stopping_ = true;
    }
    wait_cv_.notify_all();
    queue_.close();

    if (worker_ && worker_->joinable()) {
        worker_->join();
    }
    running_ = false;
}

bool EnforcementDispatcher::submit(const EnforcementAction& action) {
    std::optional<EnforcementAction> dropped;
    if (!queue_.pushDropOldest(action, dropped)) {
        return false;
    }
    if (dropped) {
        ++dropped_;
        if (logging_module_) {
            logging_module_->log(LogLevel::WARNING, "EnforcementDispatcher", "submit",
                                 "Queue full, dropped pending " + std::string(actionName(*dropped)) +
                                 " for " + dropped->source.key(),
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
        raiseAlert("enforcement_dropped", *dropped);
    }
    return true;
}

void EnforcementDispatcher::workerLoop() {
    auto next_retry = std::chrono::steady_clock::now() + config_.pending_retry_interval;
    const auto poll = std::min<std::chrono::milliseconds>(config_.pending_retry_interval,
                                                          std::chrono::milliseconds(250));

    while (true) {
        auto action = queue_.popFor(poll);
        if (action) {
            process(*action);
        } else if (queue_.isClosed()) {
            break;
        }

        if (!stopping_ && std::chrono::steady_clock::now() >= next_retry) {
            retryPending();
            next_retry = std::chrono::steady_clock::now() + config_.pending_retry_interval;
        }
    }
}

void EnforcementDispatcher::process(const EnforcementAction& action) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        // A newer action supersedes any pending one for the same source
        pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                      [&](const EnforcementAction& pending) {
                                          return pending.source == action.source;
                                      }),
                       pending_.end());

        bool enforced = enforced_.count(action.source) > 0;
        bool redundant = action.type == EnforcementActionType::BLOCK ? enforced : !enforced;
        if (redundant) {
            ++skipped_;
            if (logging_module_) {
                logging_module_->log(LogLevel::DEBUG, "EnforcementDispatcher", "process",
                                     std::string("Skipping redundant ") + actionName(action) +
                                     " for " + action.source.key(),
                                     __FILE__, __FUNCTION__, std::to_string(__LINE__));
            }
            return;
        }
    }

    if (attempt(action)) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (action.type == EnforcementActionType::BLOCK) {
            enforced_.insert(action.source);
        } else {
            enforced_.erase(action.source);
        }
        ++completed_;
        return;
    }

    ++failed_;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pending_.push_back(action);
    }
    if (logging_module_) {
        logging_module_->log(LogLevel::ERROR, "EnforcementDispatcher", "process",
                             std::string("Retries exhausted for ") + actionName(action) + " of " +
                             action.source.key() + ", marked pending",
                             __FILE__, __FUNCTION__, std::to_string(__LINE__), action.toJson());
    }
    raiseAlert("enforcement_failed", action);
}

bool EnforcementDispatcher::attempt(const EnforcementAction& action) {
    auto backoff = config_.initial_backoff;
    for (int attempt_number = 0;; ++attempt_number) {
        if (call(action)) {
            return true;
        }
        if (attempt_number >= config_.max_retries || stopping_) {
            return false;
        }

        if (logging_module_) {
            logging_module_->log(LogLevel::WARNING, "EnforcementDispatcher", "attempt",
                                 std::string(actionName(action)) + " of " + action.source.key() +
                                 " failed, retrying in " + std::to_string(backoff.count()) + "ms",
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, backoff, [this]() { return stopping_.load(); });
        backoff = std::min(backoff * 2, config_.max_backoff);
    }
}

bool EnforcementDispatcher::call(const EnforcementAction& action) {
    try {
        if (action.type == EnforcementActionType::UNBLOCK) {
            return gateway_->unblock(action.source);
        }
        std::chrono::seconds duration(0);
        if (action.rule && !action.rule->isPermanent()) {
            duration = action.rule->duration;
        }
        return gateway_->block(action.source, duration);
    } catch (const std::exception& e) {
        if (logging_module_) {
            logging_module_->log(LogLevel::ERROR, "EnforcementDispatcher", "call",
                                 std::string("Gateway error: ") + e.what(),
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
        return false;
    }
}

void EnforcementDispatcher::retryPending() {
    std::vector<EnforcementAction> pending;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pending.swap(pending_);
    }
    if (pending.empty()) {
        return;
    }

    size_t recovered = 0;
    std::vector<EnforcementAction> still_failing;
    for (const auto& action : pending) {
        if (call(action)) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (action.type == EnforcementActionType::BLOCK) {
                enforced_.insert(action.source);
            } else {
                enforced_.erase(action.source);
            }
            ++completed_;
            ++recovered;
        } else {
            still_failing.push_back(action);
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        // Actions queued for the same source meanwhile win over the retried ones
        for (auto& action : still_failing) {
            bool superseded = std::any_of(pending_.begin(), pending_.end(),
                                          [&](const EnforcementAction& newer) {
                                              return newer.source == action.source;
                                          });
            if (!superseded) {
                pending_.push_back(std::move(action));
            }
        }
    }

    if (logging_module_) {
        logging_module_->log(recovered == pending.size() ? LogLevel::INFO : LogLevel::WARNING,
                             "EnforcementDispatcher", "retryPending",
                             "Recovered " + std::to_string(recovered) + " of " +
                             std::to_string(pending.size()) + " pending actions",
                             __FILE__, __FUNCTION__, std::to_string(__LINE__));
    }
}

bool EnforcementDispatcher::isEnforced(const event_management::SourceIdentity& source) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return enforced_.count(source) > 0;
}

size_t EnforcementDispatcher::pendingRetries() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pending_.size();
}

void EnforcementDispatcher::raiseAlert(const std::string& reason, const EnforcementAction& action) {
    if (!alert_handler_) {
        return;
    }
    try {
        alert_handler_(reason, action);
    } catch (const std::exception& e) {
        if (logging_module_) {
            logging_module_->log(LogLevel::ERROR, "EnforcementDispatcher", "raiseAlert",
                                 std::string("Alert handler failed: ") + e.what(),
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
    }
}

} // namespace response
} // namespace sovereign_defense
