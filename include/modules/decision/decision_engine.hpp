#pragma once

#include "modules/config/defense_config.hpp"
#include "modules/decision/expiry_schedule.hpp"
#include "modules/decision/threat_state.hpp"
#include "modules/evidence/evidence_record.hpp"
#include "modules/event_management/sharded_map.hpp"
#include "modules/logging/logging_module.hpp"
#include <vector>
#include <memory>
#include <optional>

namespace sovereign_defense {
namespace decision {

/**
 * @brief Turns committed evidence into block/unblock decisions
 *
 * Each source has its own ThreatState. All transitions of one source happen
 * under that source's shard lock, so concurrent violations for the same
 * source produce a single WATCHED -> BLOCKED transition. The engine only
 * accepts committed EvidenceRecords, so no action can precede its evidence.
 *
 * Block duration is base * 2^(prior blocks), capped at block_escalation_cap.
 * Violation history is kept for the recidivism retention period, including
 * across blocks.
 */
class DecisionEngine {
public:
    DecisionEngine(const config::DecisionConfig& config,
                   std::shared_ptr<logging::LoggingModule> logging_module = nullptr);

    /**
     * @brief Re-evaluates the record's source after a new violation
     *
     * Evaluated at the event's timestamp. An overdue block is expired first,
     * a violation during an active block extends it.
     *
     * @return Actions to hand to the enforcement gateway, in order
     */
    std::vector<EnforcementAction> onEvidence(const evidence::EvidenceRecord& record);

    /**
     * @brief Applies an already committed record without producing actions
     *
     * Used at startup to rebuild state from ledger history. Records must be
     * replayed in sequence order, before any concurrent onEvidence call.
     */
    void replay(const evidence::EvidenceRecord& record);

    /**
     * @brief Converges enforcement on the replayed state
     *
     * @return BLOCK for every source whose block is active in the replayed
     *         history, followed by UNBLOCK for the blocks already elapsed at now
     */
    std::vector<EnforcementAction> resumeEnforcement(TimePoint now);

    /**
     * @brief Expires due blocks and evicts sources past the retention window
     *
     * @return UNBLOCK actions for the expired blocks
     */
    std::vector<EnforcementAction> sweep(TimePoint now);

    /**
     * @brief Operator release of an active block
     *
     * Releasing a source without an active block is a logged no-op.
     */
    std::optional<EnforcementAction> release(const event_management::SourceIdentity& source, TimePoint now);

    std::optional<ThreatState> snapshot(const event_management::SourceIdentity& source) const;

    /**
     * @brief Duration of the next block for a source with prior_blocks earlier blocks
     */
    std::chrono::seconds blockDuration(size_t prior_blocks) const;

    size_t trackedSources() const { return states_.size(); }
    size_t pendingExpiries() const { return expiries_.size(); }

private:
    EnforcementAction expireBlock(const event_management::SourceIdentity& source, ThreatState& state,
                                  TimePoint now, const std::string& reason);
    EnforcementAction startBlock(const event_management::SourceIdentity& source, ThreatState& state,
                                 TimePoint now);
    void logTransition(const event_management::SourceIdentity& source, ThreatLifecycle from,
                       ThreatLifecycle to, const std::string& detail) const;

    config::DecisionConfig config_;
    std::shared_ptr<logging::LoggingModule> logging_module_;
    mutable event_management::ShardedMap<ThreatState> states_;
    ExpirySchedule expiries_;
    bool replaying_ = false;
};

} // namespace decision
} // namespace sovereign_defense
