#include "modules/event_management/security_event.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sovereign_defense {
namespace event_management {

std::string eventKindToString(SecurityEventKind kind) {
    switch (kind) {
        case SecurityEventKind::PORT_SCAN: return "port_scan";
        case SecurityEventKind::UNAUTHORIZED_CONNECTION: return "unauthorized_connection";
        case SecurityEventKind::PROCESS_ANOMALY: return "process_anomaly";
        case SecurityEventKind::SENSITIVE_FILE_ACCESS: return "sensitive_file_access";
    }
    return "port_scan";
}

std::optional<SecurityEventKind> eventKindFromString(const std::string& name) {
    if (name == "port_scan") {
        return SecurityEventKind::PORT_SCAN;
    } else if (name == "unauthorized_connection") {
        return SecurityEventKind::UNAUTHORIZED_CONNECTION;
    } else if (name == "process_anomaly") {
        return SecurityEventKind::PROCESS_ANOMALY;
    } else if (name == "sensitive_file_access") {
        return SecurityEventKind::SENSITIVE_FILE_ACCESS;
    }
    return std::nullopt;
}

std::string severityToString(SeverityLevel severity) {
    switch (severity) {
        case SeverityLevel::LOW: return "low";
        case SeverityLevel::MEDIUM: return "medium";
        case SeverityLevel::HIGH: return "high";
        case SeverityLevel::CRITICAL: return "critical";
    }
    return "low";
}

std::optional<SeverityLevel> severityFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "low") {
        return SeverityLevel::LOW;
    } else if (lower == "medium") {
        return SeverityLevel::MEDIUM;
    } else if (lower == "high") {
        return SeverityLevel::HIGH;
    } else if (lower == "critical") {
        return SeverityLevel::CRITICAL;
    }
    return std::nullopt;
}

SeverityLevel severityForScore(double score) {
    if (score >= 0.9) {
        return SeverityLevel::CRITICAL;
    } else if (score >= 0.6) {
        return SeverityLevel::HIGH;
    } else if (score >= 0.3) {
        return SeverityLevel::MEDIUM;
    }
    return SeverityLevel::LOW;
}

SecurityEvent::SecurityEvent(SecurityEventKind kind,
                             const SourceIdentity& source,
                             SeverityLevel severity,
                             double score,
                             const nlohmann::json& payload,
                             TimePoint timestamp)
    : kind_(kind)
    , source_(source)
    , severity_(severity)
    , score_(std::clamp(score, 0.0, 1.0))
    , payload_(payload)
    , timestamp_(timestamp) {}

nlohmann::json SecurityEvent::toJson() const {
    nlohmann::json j;
    j["kind"] = eventKindToString(kind_);
    j["source"] = source_.toJson();
    j["severity"] = severityToString(severity_);
    j["score"] = score_;
    j["payload"] = payload_;
    j["timestamp"] = toMillis(timestamp_);
    return j;
}

SecurityEvent SecurityEvent::fromJson(const nlohmann::json& json) {
    auto kind_name = json.at("kind").get<std::string>();
    auto kind = eventKindFromString(kind_name);
    if (!kind) {
        throw std::invalid_argument("Unknown security event kind: " + kind_name);
    }
    auto severity_name = json.at("severity").get<std::string>();
    auto severity = severityFromString(severity_name);
    if (!severity) {
        throw std::invalid_argument("Unknown severity: " + severity_name);
    }

    return SecurityEvent(*kind,
                         SourceIdentity::fromJson(json.at("source")),
                         *severity,
                         json.at("score").get<double>(),
                         json.value("payload", nlohmann::json::object()),
                         fromMillis(json.at("timestamp").get<int64_t>()));
}

} // namespace event_management
} // namespace sovereign_defense
