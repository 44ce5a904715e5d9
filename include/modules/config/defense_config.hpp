#pragma once

#include "modules/config/config_reader.hpp"
#include "modules/event_management/observation.hpp"
#include "modules/event_management/security_event.hpp"
#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace sovereign_defense {
namespace config {

/**
 * @brief How a file sensitivity rule pattern is compared with a path
 */
enum class RuleMatchType {
    EXACT,
    PREFIX,
    GLOB
};

std::string ruleMatchTypeToString(RuleMatchType type);

/**
 * @brief Sensitive path rule
 *
 * access_kinds restricts the rule to some access kinds; empty means all.
 */
struct FileSensitivityRule {
    std::string name;
    std::string pattern;
    RuleMatchType match_type = RuleMatchType::EXACT;
    event_management::SeverityLevel min_severity = event_management::SeverityLevel::LOW;
    std::set<event_management::FileAccessKind> access_kinds;
};

/**
 * @brief Footprint mean and spread assumed for executables without a mature baseline
 */
struct DefaultProcessBaseline {
    event_management::ProcessFootprint mean{10.0, 5.0, 4.0, 16.0};
    event_management::ProcessFootprint stddev{15.0, 10.0, 8.0, 32.0};
};

struct DetectionConfig {
    // Port scan detection
    std::chrono::seconds scan_window{60};
    size_t scan_port_threshold = 15;

    // Connection policy
    std::vector<std::string> connection_allow_list;
    std::vector<std::string> connection_deny_list;
    std::set<uint16_t> expected_service_ports;
    std::chrono::seconds connection_dedup_window{30};
    bool ignore_loopback = true;
    std::vector<std::string> local_addresses;

    // Process behaviour
    std::chrono::seconds process_learning_period{3600};
    double process_anomaly_sensitivity = 3.0;
    size_t baseline_min_samples = 10;
    size_t baseline_max_samples = 1000;
    double baseline_min_stddev = 1.0;
    // Consecutive anomalous readings of one pid required before emitting
    size_t anomaly_consecutive_readings = 1;
    // A pid silent for longer is treated as a new process
    std::chrono::seconds process_pid_idle_timeout{300};
    // Upper bound on learned per-executable baselines
    size_t baseline_max_executables = 4096;
    DefaultProcessBaseline default_process_baseline;
    std::vector<std::string> suspicious_process_names;
    std::vector<std::string> excluded_executables;

    // File access
    std::vector<FileSensitivityRule> file_sensitivity_rules;
    std::chrono::seconds file_dedup_window{1};
};

struct DecisionConfig {
    std::chrono::seconds block_base_duration{300};
    std::chrono::seconds block_escalation_cap{86400};
    size_t block_violation_threshold = 3;
    std::chrono::seconds violation_accounting_window{3600};
    std::chrono::seconds recidivism_retention_period{604800};
    // Number of prior blocks after which the next block is permanent, 0 disables
    size_t permanent_block_after = 0;
    size_t shard_count = 16;
};

struct EvidenceConfig {
    // "file" or "memory"
    std::string storage = "file";
    std::string ledger_path = "data/evidence.ledger";
    std::string hmac_key;
    bool verify_on_startup = true;
};

struct EnforcementConfig {
    size_t queue_size = 1024;
    int max_retries = 5;
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{30000};
    std::chrono::milliseconds pending_retry_interval{60000};
    bool dry_run = true;
    // Blocks are re-applied after a restart, so the block command checks first
    std::string block_command = "iptables -C INPUT -s {address} -j DROP 2>/dev/null || iptables -I INPUT -s {address} -j DROP";
    std::string unblock_command = "iptables -D INPUT -s {address} -j DROP";
    std::string process_block_command;
    std::string process_unblock_command;
};

struct WebhookSinkConfig {
    bool enabled = false;
    std::string url;
    long timeout_seconds = 5;
    std::string username;
    std::string password;
    std::string ca_cert_path;
};

struct AmqpSinkConfig {
    bool enabled = false;
    std::string host = "localhost";
    int port = 5672;
    std::string username = "guest";
    std::string password = "guest";
    std::string vhost = "/";
    std::string exchange = "sovereign_defense.alerts";
    std::string routing_key_prefix = "alert";
};

struct AlertingConfig {
    size_t queue_size = 1024;
    event_management::SeverityLevel min_severity = event_management::SeverityLevel::MEDIUM;
    bool log_sink = true;
    WebhookSinkConfig webhook;
    AmqpSinkConfig amqp;
};

struct PipelineConfig {
    size_t ingest_queue_size = 4096;
    size_t worker_count = 4;
    size_t worker_queue_size = 1024;
    size_t ledger_queue_size = 4096;
    std::chrono::milliseconds sweep_interval{1000};
    std::chrono::seconds status_interval{60};
};

struct CaptureConfig {
    std::vector<std::string> feeds;
    std::chrono::milliseconds poll_interval{500};
    bool start_at_end = false;
};

struct DefenseConfig {
    DetectionConfig detection;
    DecisionConfig decision;
    EvidenceConfig evidence;
    EnforcementConfig enforcement;
    AlertingConfig alerting;
    PipelineConfig pipeline;
    CaptureConfig capture;
};

/**
 * @brief Builds the typed configuration from the "modules" sections
 *
 * Absent sections and keys keep their defaults.
 *
 * @throws std::runtime_error naming the offending key on an invalid value
 */
DefenseConfig loadDefenseConfig(const ConfigReader& reader);

/**
 * @brief Checks cross-field constraints of an already built configuration
 *
 * @throws std::runtime_error naming the offending key
 */
void validateDefenseConfig(const DefenseConfig& config);

/**
 * @brief Default sensitive path rules used when none are configured
 */
std::vector<FileSensitivityRule> defaultFileSensitivityRules();

/**
 * @brief Default suspicious executable names (scanners, exploitation kits, dumpers, miners)
 */
std::vector<std::string> defaultSuspiciousProcessNames();

} // namespace config
} // namespace sovereign_defense
