#include "modules/decision/decision_engine.hpp"
#include <algorithm>

namespace sovereign_defense {
namespace decision {

using event_management::SourceIdentity;
using logging::LogLevel;

DecisionEngine::DecisionEngine(const config::DecisionConfig& config,
                               std::shared_ptr<logging::LoggingModule> logging_module)
    : config_(config)
    , logging_module_(std::move(logging_module))
    , states_(config.shard_count) {}

std::chrono::seconds DecisionEngine::blockDuration(size_t prior_blocks) const {
    auto duration = config_.block_base_duration;
    for (size_t i = 0; i < prior_blocks && duration < config_.block_escalation_cap; ++i) {
        duration *= 2;
    }
    return std::min(duration, config_.block_escalation_cap);
}

void DecisionEngine::logTransition(const SourceIdentity& source, ThreatLifecycle from,
                                   ThreatLifecycle to, const std::string& detail) const {
    if (!logging_module_ || replaying_) {
        return;
    }
    logging_module_->log(to == ThreatLifecycle::BLOCKED ? LogLevel::WARNING : LogLevel::INFO,
                         "DecisionEngine", "transition",
                         source.key() + ": " + lifecycleToString(from) + " -> " + lifecycleToString(to) +
                         (detail.empty() ? "" : " (" + detail + ")"),
                         __FILE__, __FUNCTION__, std::to_string(__LINE__));
}

EnforcementAction DecisionEngine::expireBlock(const SourceIdentity& source, ThreatState& state,
                                              TimePoint now, const std::string& reason) {
    EnforcementAction action;
    action.type = EnforcementActionType::UNBLOCK;
    action.source = source;
    action.rule = state.active_block;
    action.issued_at = now;
    action.reason = reason;

    logTransition(source, state.lifecycle, ThreatLifecycle::EXPIRED, reason);
    state.lifecycle = ThreatLifecycle::EXPIRED;
    state.active_block.reset();
    state.block_expiry.reset();
    ++state.generation;
    return action;
}

EnforcementAction DecisionEngine::startBlock(const SourceIdentity& source, ThreatState& state, TimePoint now) {
    BlockRule rule;
    rule.scope = source;
    rule.created_at = now;
    rule.first_evidence_sequence = state.first_evidence_sequence;
    rule.last_evidence_sequence = state.last_evidence_sequence;

    bool permanent = config_.permanent_block_after > 0 && state.prior_block_count >= config_.permanent_block_after;
    if (permanent) {
        rule.action = BlockAction::PERMANENT_BLOCK;
        rule.reason = std::to_string(state.prior_block_count) + " prior blocks";
    } else {
        rule.action = BlockAction::TEMPORARY_BLOCK;
        rule.duration = blockDuration(state.prior_block_count);
        rule.expires_at = now + rule.duration;
        rule.reason = std::to_string(state.violationsSince(now - config_.violation_accounting_window)) +
                      " violations within " + std::to_string(config_.violation_accounting_window.count()) + "s";
    }

    logTransition(source, state.lifecycle, ThreatLifecycle::BLOCKED, rule.reason);

    state.lifecycle = ThreatLifecycle::BLOCKED;
    state.active_block = rule;
    state.block_expiry = rule.expires_at;
    ++state.prior_block_count;
    ++state.generation;
    if (rule.expires_at) {
        expiries_.schedule(source, *rule.expires_at, state.generation);
    }

    EnforcementAction action;
    action.type = EnforcementActionType::BLOCK;
    action.source = source;
    action.rule = rule;
    action.issued_at = now;
    action.reason = rule.reason;
    return action;
}

std::vector<EnforcementAction> DecisionEngine::onEvidence(const evidence::EvidenceRecord& record) {
    const auto& event = record.event;
    const SourceIdentity& source = event.getSource();
    const TimePoint now = event.getTimestamp();

    return states_.withEntry(source, [&](ThreatState& state) {
        std::vector<EnforcementAction> actions;

        if (state.lifecycle == ThreatLifecycle::BLOCKED && state.block_expiry && *state.block_expiry <= now) {
            actions.push_back(expireBlock(source, state, now, "block elapsed"));
        }

        // Record the violation, keeping the history ordered by time
        state.violations.insert(std::upper_bound(state.violations.begin(), state.violations.end(), now), now);
        ++state.violation_count;
        state.last_violation = state.last_violation ? std::max(*state.last_violation, now) : now;
        if (state.first_evidence_sequence == 0) {
            state.first_evidence_sequence = record.sequence;
        }
        state.last_evidence_sequence = std::max(state.last_evidence_sequence, record.sequence);

        const TimePoint retention_start = *state.last_violation - config_.recidivism_retention_period;
        while (!state.violations.empty() && state.violations.front() <= retention_start) {
            state.violations.pop_front();
        }

        switch (state.lifecycle) {
            case ThreatLifecycle::UNKNOWN:
            case ThreatLifecycle::EXPIRED:
                logTransition(source, state.lifecycle, ThreatLifecycle::WATCHED,
                              event_management::eventKindToString(event.getKind()));
                state.lifecycle = ThreatLifecycle::WATCHED;
                break;
            case ThreatLifecycle::BLOCKED:
                if (state.active_block && !state.active_block->isPermanent()) {
                    TimePoint extended = now + state.active_block->duration;
                    if (!state.block_expiry || extended > *state.block_expiry) {
                        // Expiry moves later; the scheduled entry is re-queued when it fires
                        state.block_expiry = extended;
                        state.active_block->expires_at = extended;
                        state.active_block->last_evidence_sequence = state.last_evidence_sequence;
                    }
                }
                return actions;
            case ThreatLifecycle::WATCHED:
                break;
        }

        size_t recent = state.violationsSince(now - config_.violation_accounting_window);
        if (recent >= config_.block_violation_threshold) {
            actions.push_back(startBlock(source, state, now));
        }
        return actions;
    });
}

void DecisionEngine::replay(const evidence::EvidenceRecord& record) {
    replaying_ = true;
    onEvidence(record);
    replaying_ = false;
}

std::vector<EnforcementAction> DecisionEngine::resumeEnforcement(TimePoint now) {
    std::vector<EnforcementAction> actions;
    states_.forEach([&](const SourceIdentity& source, ThreatState& state) {
        if (state.lifecycle != ThreatLifecycle::BLOCKED || !state.active_block) {
            return;
        }
        EnforcementAction action;
        action.type = EnforcementActionType::BLOCK;
        action.source = source;
        action.rule = state.active_block;
        action.issued_at = now;
        action.reason = "restored from evidence ledger";
        actions.push_back(action);
    });
    const size_t restored = actions.size();

    auto elapsed = sweep(now);
    actions.insert(actions.end(), elapsed.begin(), elapsed.end());

    if (logging_module_ && restored > 0) {
        logging_module_->log(LogLevel::INFO, "DecisionEngine", "resumeEnforcement",
                             "Restored " + std::to_string(restored) + " blocks, " +
                             std::to_string(elapsed.size()) + " already elapsed",
                             __FILE__, __FUNCTION__, std::to_string(__LINE__));
    }
    return actions;
}

std::vector<EnforcementAction> DecisionEngine::sweep(TimePoint now) {
    std::vector<EnforcementAction> actions;

    for (const auto& entry : expiries_.popDue(now)) {
        states_.withExisting(entry.source, [&](ThreatState& state) {
            if (state.generation != entry.generation || state.lifecycle != ThreatLifecycle::BLOCKED) {
                return;
            }
            if (state.block_expiry && *state.block_expiry > now) {
                expiries_.schedule(entry.source, *state.block_expiry, state.generation);
                return;
            }
            actions.push_back(expireBlock(entry.source, state, now, "block elapsed"));
        });
    }

    size_t evicted = states_.eraseIf([&](const SourceIdentity&, ThreatState& state) {
        const TimePoint retention_start = now - config_.recidivism_retention_period;
        while (!state.violations.empty() && state.violations.front() <= retention_start) {
            state.violations.pop_front();
        }
        return state.lifecycle != ThreatLifecycle::BLOCKED && state.violations.empty() &&
               (!state.last_violation || *state.last_violation <= retention_start);
    });

    if (evicted > 0 && logging_module_) {
        logging_module_->log(LogLevel::DEBUG, "DecisionEngine", "sweep",
                             "Evicted " + std::to_string(evicted) + " sources past retention",
                             __FILE__, __FUNCTION__, std::to_string(__LINE__));
    }
    return actions;
}

std::optional<EnforcementAction> DecisionEngine::release(const SourceIdentity& source, TimePoint now) {
    std::optional<EnforcementAction> action;
    states_.withExisting(source, [&](ThreatState& state) {
        if (state.lifecycle == ThreatLifecycle::BLOCKED) {
            action = expireBlock(source, state, now, "released by operator");
        }
    });

    if (!action && logging_module_) {
        logging_module_->log(LogLevel::WARNING, "DecisionEngine", "release",
                             "No active block to release for " + source.key(),
                             __FILE__, __FUNCTION__, std::to_string(__LINE__));
    }
    return action;
}

std::optional<ThreatState> DecisionEngine::snapshot(const SourceIdentity& source) const {
    std::optional<ThreatState> state;
    states_.withExisting(source, [&](ThreatState& current) {
        state = current;
    });
    return state;
}

} // namespace decision
} // namespace sovereign_defense
