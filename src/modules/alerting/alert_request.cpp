#include "modules/alerting/alert_request.hpp"

namespace sovereign_defense {
namespace alerting {

using event_management::SeverityLevel;
using event_management::severityToString;

std::string alertCategoryToString(AlertCategory category) {
    switch (category) {
        case AlertCategory::SECURITY_EVENT: return "security_event";
        case AlertCategory::ENFORCEMENT_ACTION: return "enforcement_action";
        case AlertCategory::SYSTEM: return "system";
    }
    return "system";
}

AlertRequest AlertRequest::fromEvent(const event_management::SecurityEvent& event,
                                     std::optional<uint64_t> evidence_sequence) {
    AlertRequest request;
    request.category = AlertCategory::SECURITY_EVENT;
    request.severity = event.getSeverity();
    request.title = event_management::eventKindToString(event.getKind());
    request.source = event.getSource();
    request.evidence_sequence = evidence_sequence;
    request.details = event.toJson();
    request.timestamp = event.getTimestamp();
    return request;
}

AlertRequest AlertRequest::fromAction(const decision::EnforcementAction& action) {
    AlertRequest request;
    request.category = AlertCategory::ENFORCEMENT_ACTION;
    bool block = action.type == decision::EnforcementActionType::BLOCK;
    request.severity = block ? SeverityLevel::HIGH : SeverityLevel::LOW;
    request.title = block ? "block" : "unblock";
    request.source = action.source;
    if (action.rule) {
        request.evidence_sequence = action.rule->last_evidence_sequence;
    }
    request.details = action.toJson();
    request.timestamp = action.issued_at;
    return request;
}

AlertRequest AlertRequest::system(SeverityLevel severity, const std::string& title, const nlohmann::json& details) {
    AlertRequest request;
    request.category = AlertCategory::SYSTEM;
    request.severity = severity;
    request.title = title;
    request.details = details;
    request.timestamp = event_management::Clock::now();
    return request;
}

std::string AlertRequest::topic() const {
    return alertCategoryToString(category) + "." + title + "." + severityToString(severity);
}

nlohmann::json AlertRequest::toJson() const {
    nlohmann::json j;
    j["category"] = alertCategoryToString(category);
    j["severity"] = severityToString(severity);
    j["title"] = title;
    j["timestamp"] = event_management::toMillis(timestamp);
    if (source) {
        j["source"] = source->toJson();
    }
    if (evidence_sequence) {
        j["evidence_sequence"] = *evidence_sequence;
    }
    j["details"] = details;
    return j;
}

} // namespace alerting
} // namespace sovereign_defense
