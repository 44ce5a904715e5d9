#pragma once

#include "modules/event_management/source_identity.hpp"
#include "modules/event_management/observation.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace sovereign_defense {
namespace event_management {

enum class SecurityEventKind {
    PORT_SCAN,
    UNAUTHORIZED_CONNECTION,
    PROCESS_ANOMALY,
    SENSITIVE_FILE_ACCESS
};

/**
 * @brief Severity band, ordered so that comparisons mean "at least as severe"
 */
enum class SeverityLevel {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

std::string eventKindToString(SecurityEventKind kind);
std::optional<SecurityEventKind> eventKindFromString(const std::string& name);
std::string severityToString(SeverityLevel severity);
std::optional<SeverityLevel> severityFromString(const std::string& name);

/**
 * @brief Maps a normalised score in [0, 1] onto a severity band
 */
SeverityLevel severityForScore(double score);

/**
 * @brief Classified detection produced by a detector
 *
 * Immutable after creation. The score is the detector's normalised
 * severity in [0, 1]; the payload carries the detector specific evidence.
 */
class SecurityEvent {
public:
    SecurityEvent(SecurityEventKind kind,
                  const SourceIdentity& source,
                  SeverityLevel severity,
                  double score,
                  const nlohmann::json& payload,
                  TimePoint timestamp);

    // Getters
    SecurityEventKind getKind() const { return kind_; }
    const SourceIdentity& getSource() const { return source_; }
    SeverityLevel getSeverity() const { return severity_; }
    double getScore() const { return score_; }
    const nlohmann::json& getPayload() const { return payload_; }
    TimePoint getTimestamp() const { return timestamp_; }

    // Serialize/Deserialize
    nlohmann::json toJson() const;
    static SecurityEvent fromJson(const nlohmann::json& json);

private:
    SecurityEventKind kind_;
    SourceIdentity source_;
    SeverityLevel severity_;
    double score_;
    nlohmann::json payload_;
    TimePoint timestamp_;
};

} // namespace event_management
} // namespace sovereign_defense
