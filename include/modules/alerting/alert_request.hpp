#pragma once

#include "modules/decision/threat_state.hpp"
#include "modules/event_management/security_event.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace sovereign_defense {
namespace alerting {

enum class AlertCategory {
    SECURITY_EVENT,
    ENFORCEMENT_ACTION,
    SYSTEM
};

std::string alertCategoryToString(AlertCategory category);

/**
 * @brief Notification handed to the alert sinks
 *
 * Built from a committed SecurityEvent, from an EnforcementAction, or from
 * an internal condition (ledger halt, enforcement failure, queue drop).
 */
struct AlertRequest {
    AlertCategory category = AlertCategory::SYSTEM;
    event_management::SeverityLevel severity = event_management::SeverityLevel::MEDIUM;
    std::string title;
    std::optional<event_management::SourceIdentity> source;
    std::optional<uint64_t> evidence_sequence;
    nlohmann::json details = nlohmann::json::object();
    event_management::TimePoint timestamp{};

    static AlertRequest fromEvent(const event_management::SecurityEvent& event,
                                  std::optional<uint64_t> evidence_sequence = std::nullopt);
    static AlertRequest fromAction(const decision::EnforcementAction& action);
    static AlertRequest system(event_management::SeverityLevel severity,
                               const std::string& title,
                               const nlohmann::json& details = nlohmann::json::object());

    /**
     * @brief Routing key suffix, e.g. "security_event.port_scan.high"
     */
    std::string topic() const;

    nlohmann::json toJson() const;
};

} // namespace alerting
} // namespace sovereign_defense
