#pragma once

#include "modules/event_management/observation.hpp"
#include "modules/event_management/source_identity.hpp"
#include <deque>
#include <string>
#include <chrono>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace sovereign_defense {
namespace decision {

using event_management::TimePoint;

/**
 * @brief Lifecycle of a source: UNKNOWN -> WATCHED -> BLOCKED -> EXPIRED -> WATCHED ...
 */
enum class ThreatLifecycle {
    UNKNOWN,
    WATCHED,
    BLOCKED,
    EXPIRED
};

std::string lifecycleToString(ThreatLifecycle lifecycle);

enum class BlockAction {
    TEMPORARY_BLOCK,
    PERMANENT_BLOCK
};

/**
 * @brief Time-bounded enforcement directive
 *
 * The reason references the evidence records that led to the block.
 */
struct BlockRule {
    event_management::SourceIdentity scope;
    BlockAction action = BlockAction::TEMPORARY_BLOCK;
    std::chrono::seconds duration{0};
    TimePoint created_at{};
    std::optional<TimePoint> expires_at;
    uint64_t first_evidence_sequence = 0;
    uint64_t last_evidence_sequence = 0;
    std::string reason;

    bool isPermanent() const { return action == BlockAction::PERMANENT_BLOCK; }
    nlohmann::json toJson() const;
};

enum class EnforcementActionType {
    BLOCK,
    UNBLOCK
};

/**
 * @brief Block/unblock directive sent towards the enforcement gateway
 */
struct EnforcementAction {
    EnforcementActionType type = EnforcementActionType::BLOCK;
    event_management::SourceIdentity source;
    std::optional<BlockRule> rule;
    TimePoint issued_at{};
    std::string reason;

    nlohmann::json toJson() const;
};

/**
 * @brief Per-source record owned by the decision engine
 */
struct ThreatState {
    ThreatLifecycle lifecycle = ThreatLifecycle::UNKNOWN;
    // Violation times still inside the retention window, oldest first
    std::deque<TimePoint> violations;
    uint64_t violation_count = 0;
    std::optional<TimePoint> last_violation;
    std::optional<TimePoint> block_expiry;
    std::optional<BlockRule> active_block;
    size_t prior_block_count = 0;
    uint64_t first_evidence_sequence = 0;
    uint64_t last_evidence_sequence = 0;
    // Bumped whenever a block starts or ends, invalidates scheduled expiries
    uint64_t generation = 0;

    size_t violationsSince(TimePoint since) const;
    nlohmann::json toJson() const;
};

} // namespace decision
} // namespace sovereign_defense
