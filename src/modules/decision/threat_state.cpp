#include "modules/decision/threat_state.hpp"
#include <algorithm>
#include <iterator>

namespace sovereign_defense {
namespace decision {

using event_management::toMillis;

std::string lifecycleToString(ThreatLifecycle lifecycle) {
    switch (lifecycle) {
        case ThreatLifecycle::UNKNOWN: return "unknown";
        case ThreatLifecycle::WATCHED: return "watched";
        case ThreatLifecycle::BLOCKED: return "blocked";
        case ThreatLifecycle::EXPIRED: return "expired";
    }
    return "unknown";
}

nlohmann::json BlockRule::toJson() const {
    nlohmann::json j;
    j["scope"] = scope.toJson();
    j["action"] = isPermanent() ? "permanent_block" : "temporary_block";
    j["duration_seconds"] = duration.count();
    j["created_at"] = toMillis(created_at);
    j["expires_at"] = expires_at ? nlohmann::json(toMillis(*expires_at)) : nlohmann::json(nullptr);
    j["evidence"] = {{"first_sequence", first_evidence_sequence}, {"last_sequence", last_evidence_sequence}};
    j["reason"] = reason;
    return j;
}

nlohmann::json EnforcementAction::toJson() const {
    nlohmann::json j;
    j["type"] = type == EnforcementActionType::BLOCK ? "block" : "unblock";
    j["source"] = source.toJson();
    j["issued_at"] = toMillis(issued_at);
    j["reason"] = reason;
    if (rule) {
        j["rule"] = rule->toJson();
    }
    return j;
}

size_t ThreatState::violationsSince(TimePoint since) const {
    auto first = std::upper_bound(violations.begin(), violations.end(), since);
    return static_cast<size_t>(std::distance(first, violations.end()));
}

nlohmann::json ThreatState::toJson() const {
    nlohmann::json j;
    j["lifecycle"] = lifecycleToString(lifecycle);
    j["violation_count"] = violation_count;
    j["retained_violations"] = violations.size();
    j["last_violation"] = last_violation ? nlohmann::json(toMillis(*last_violation)) : nlohmann::json(nullptr);
    j["block_expiry"] = block_expiry ? nlohmann::json(toMillis(*block_expiry)) : nlohmann::json(nullptr);
    j["prior_block_count"] = prior_block_count;
    j["evidence"] = {{"first_sequence", first_evidence_sequence}, {"last_sequence", last_evidence_sequence}};
    if (active_block) {
        j["active_block"] = active_block->toJson();
    }
    return j;
}

} // namespace decision
} // namespace sovereign_defense
