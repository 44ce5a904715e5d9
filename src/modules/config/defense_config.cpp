#include "modules/config/defense_config.hpp"
#include "modules/detection/address_matcher.hpp"
#include <stdexcept>

namespace sovereign_defense {
namespace config {

using event_management::FileAccessKind;
using event_management::SeverityLevel;

namespace {

template <typename T>
T readValue(const YAML::Node& node, const std::string& section, const std::string& key, const T& fallback) {
    if (!node || !node[key]) {
        return fallback;
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value for " + section + "." + key + ": " + e.what());
    }
}

std::vector<std::string> readStringList(const YAML::Node& node, const std::string& section,
                                        const std::string& key, const std::vector<std::string>& fallback) {
    if (!node || !node[key]) {
        return fallback;
    }
    if (!node[key].IsSequence()) {
        throw std::runtime_error("Invalid value for " + section + "." + key + ": expected a list");
    }
    std::vector<std::string> values;
    for (const auto& item : node[key]) {
        values.push_back(item.as<std::string>());
    }
    return values;
}

int64_t readPositive(const YAML::Node& node, const std::string& section, const std::string& key, int64_t fallback) {
    int64_t value = readValue<int64_t>(node, section, key, fallback);
    if (value <= 0) {
        throw std::runtime_error("Invalid value for " + section + "." + key + ": must be positive");
    }
    return value;
}

int64_t readNonNegative(const YAML::Node& node, const std::string& section, const std::string& key, int64_t fallback) {
    int64_t value = readValue<int64_t>(node, section, key, fallback);
    if (value < 0) {
        throw std::runtime_error("Invalid value for " + section + "." + key + ": must not be negative");
    }
    return value;
}

SeverityLevel readSeverity(const YAML::Node& node, const std::string& section, const std::string& key, SeverityLevel fallback) {
    if (!node || !node[key]) {
        return fallback;
    }
    auto name = readValue<std::string>(node, section, key, "");
    auto severity = event_management::severityFromString(name);
    if (!severity) {
        throw std::runtime_error("Invalid value for " + section + "." + key + ": unknown severity '" + name + "'");
    }
    return *severity;
}

void checkAddressList(const std::vector<std::string>& entries, const std::string& key) {
    for (const auto& entry : entries) {
        if (!detection::AddressPattern::parse(entry)) {
            throw std::runtime_error("Invalid value for detection." + key + ": malformed address '" + entry + "'");
        }
    }
}

event_management::ProcessFootprint readFootprint(const YAML::Node& node, const std::string& section,
                                                 const event_management::ProcessFootprint& fallback) {
    event_management::ProcessFootprint footprint;
    footprint.cpu_percent = readValue<double>(node, section, "cpu_percent", fallback.cpu_percent);
    footprint.memory_percent = readValue<double>(node, section, "memory_percent", fallback.memory_percent);
    footprint.connection_count = readValue<double>(node, section, "connection_count", fallback.connection_count);
    footprint.thread_count = readValue<double>(node, section, "thread_count", fallback.thread_count);
    return footprint;
}

FileSensitivityRule readRule(const YAML::Node& node, size_t index) {
    const std::string section = "detection.file_sensitivity_rules[" + std::to_string(index) + "]";

    FileSensitivityRule rule;
    rule.pattern = readValue<std::string>(node, section, "pattern", "");
    if (rule.pattern.empty()) {
        throw std::runtime_error("Invalid value for " + section + ".pattern: must not be empty");
    }
    rule.name = readValue<std::string>(node, section, "name", rule.pattern);

    auto match = readValue<std::string>(node, section, "match", "exact");
    if (match == "exact") {
        rule.match_type = RuleMatchType::EXACT;
    } else if (match == "prefix") {
        rule.match_type = RuleMatchType::PREFIX;
    } else if (match == "glob" || match == "pattern") {
        rule.match_type = RuleMatchType::GLOB;
    } else {
        throw std::runtime_error("Invalid value for " + section + ".match: unknown match type '" + match + "'");
    }

    rule.min_severity = readSeverity(node, section, "min_severity", SeverityLevel::LOW);

    for (const auto& kind_name : readStringList(node, section, "access_kinds", {})) {
        auto kind = event_management::accessKindFromString(kind_name);
        if (!kind) {
            throw std::runtime_error("Invalid value for " + section + ".access_kinds: unknown access kind '" + kind_name + "'");
        }
        rule.access_kinds.insert(*kind);
    }
    return rule;
}

DetectionConfig loadDetection(const YAML::Node& node) {
    const std::string section = "detection";
    DetectionConfig config;

    config.scan_window = std::chrono::seconds(readPositive(node, section, "scan_window_seconds", 60));
    config.scan_port_threshold = static_cast<size_t>(readPositive(node, section, "scan_port_threshold", 15));

    config.connection_allow_list = readStringList(node, section, "connection_allow_list", {});
    config.connection_deny_list = readStringList(node, section, "connection_deny_list", {});
    checkAddressList(config.connection_allow_list, "connection_allow_list");
    checkAddressList(config.connection_deny_list, "connection_deny_list");

    if (node && node["expected_service_ports"]) {
        for (const auto& port : node["expected_service_ports"]) {
            int value = port.as<int>();
            if (value <= 0 || value > 65535) {
                throw std::runtime_error("Invalid value for detection.expected_service_ports: " + std::to_string(value));
            }
            config.expected_service_ports.insert(static_cast<uint16_t>(value));
        }
    }
    config.connection_dedup_window = std::chrono::seconds(readPositive(node, section, "connection_dedup_seconds", 30));
    config.ignore_loopback = readValue<bool>(node, section, "ignore_loopback", true);
    config.local_addresses = readStringList(node, section, "local_addresses", {});
    checkAddressList(config.local_addresses, "local_addresses");

    config.process_learning_period = std::chrono::seconds(readNonNegative(node, section, "process_learning_period", 3600));
    config.process_anomaly_sensitivity = readValue<double>(node, section, "process_anomaly_sensitivity", 3.0);
    if (config.process_anomaly_sensitivity <= 0.0) {
        throw std::runtime_error("Invalid value for detection.process_anomaly_sensitivity: must be positive");
    }
    config.baseline_min_samples = static_cast<size_t>(readPositive(node, section, "baseline_min_samples", 10));
    config.baseline_max_samples = static_cast<size_t>(readPositive(node, section, "baseline_max_samples", 1000));
    config.baseline_min_stddev = readValue<double>(node, section, "baseline_min_stddev", 1.0);
    config.anomaly_consecutive_readings = static_cast<size_t>(readPositive(node, section, "anomaly_consecutive_readings", 1));
    config.process_pid_idle_timeout = std::chrono::seconds(readPositive(node, section, "process_pid_idle_seconds", 300));
    config.baseline_max_executables = static_cast<size_t>(readPositive(node, section, "baseline_max_executables", 4096));
    if (config.baseline_min_stddev <= 0.0) {
        throw std::runtime_error("Invalid value for detection.baseline_min_stddev: must be positive");
    }
    if (node && node["default_process_baseline"]) {
        auto baseline = node["default_process_baseline"];
        config.default_process_baseline.mean =
            readFootprint(baseline["mean"], "detection.default_process_baseline.mean", config.default_process_baseline.mean);
        config.default_process_baseline.stddev =
            readFootprint(baseline["stddev"], "detection.default_process_baseline.stddev", config.default_process_baseline.stddev);
    }
    config.suspicious_process_names = readStringList(node, section, "suspicious_process_names", defaultSuspiciousProcessNames());
    config.excluded_executables = readStringList(node, section, "excluded_executables", {});

    if (node && node["file_sensitivity_rules"]) {
        size_t index = 0;
        for (const auto& rule : node["file_sensitivity_rules"]) {
            config.file_sensitivity_rules.push_back(readRule(rule, index++));
        }
    } else {
        config.file_sensitivity_rules = defaultFileSensitivityRules();
    }
    config.file_dedup_window = std::chrono::seconds(readNonNegative(node, section, "file_dedup_seconds", 1));
    return config;
}

DecisionConfig loadDecision(const YAML::Node& node) {
    const std::string section = "decision";
    DecisionConfig config;
    config.block_base_duration = std::chrono::seconds(readPositive(node, section, "block_base_duration", 300));
    config.block_escalation_cap = std::chrono::seconds(readPositive(node, section, "block_escalation_cap", 86400));
    config.block_violation_threshold = static_cast<size_t>(readPositive(node, section, "block_violation_threshold", 3));
    config.violation_accounting_window = std::chrono::seconds(readPositive(node, section, "violation_accounting_window", 3600));
    config.recidivism_retention_period = std::chrono::seconds(readPositive(node, section, "recidivism_retention_period", 604800));
    config.permanent_block_after = static_cast<size_t>(readNonNegative(node, section, "permanent_block_after", 0));
    config.shard_count = static_cast<size_t>(readPositive(node, section, "shard_count", 16));
    return config;
}

EvidenceConfig loadEvidence(const YAML::Node& node) {
    const std::string section = "evidence";
    EvidenceConfig config;
    config.storage = readValue<std::string>(node, section, "storage", "file");
    if (config.storage != "file" && config.storage != "memory") {
        throw std::runtime_error("Invalid value for evidence.storage: '" + config.storage + "'");
    }
    config.ledger_path = readValue<std::string>(node, section, "ledger_path", config.ledger_path);
    config.hmac_key = readValue<std::string>(node, section, "hmac_key", "");
    config.verify_on_startup = readValue<bool>(node, section, "verify_on_startup", true);
    return config;
}

EnforcementConfig loadEnforcement(const YAML::Node& node) {
    const std::string section = "enforcement";
    EnforcementConfig config;
    config.queue_size = static_cast<size_t>(readPositive(node, section, "queue_size", 1024));
    config.max_retries = static_cast<int>(readNonNegative(node, section, "max_retries", 5));
    config.initial_backoff = std::chrono::milliseconds(readPositive(node, section, "initial_backoff_ms", 500));
    config.max_backoff = std::chrono::milliseconds(readPositive(node, section, "max_backoff_ms", 30000));
    config.pending_retry_interval = std::chrono::milliseconds(readPositive(node, section, "pending_retry_interval_ms", 60000));
    config.dry_run = readValue<bool>(node, section, "dry_run", true);
    config.block_command = readValue<std::string>(node, section, "block_command", config.block_command);
    config.unblock_command = readValue<std::string>(node, section, "unblock_command", config.unblock_command);
    config.process_block_command = readValue<std::string>(node, section, "process_block_command", "");
    config.process_unblock_command = readValue<std::string>(node, section, "process_unblock_command", "");
    return config;
}

AlertingConfig loadAlerting(const YAML::Node& node) {
    const std::string section = "alerting";
    AlertingConfig config;
    config.queue_size = static_cast<size_t>(readPositive(node, section, "queue_size", 1024));
    config.min_severity = readSeverity(node, section, "min_severity", SeverityLevel::MEDIUM);
    config.log_sink = readValue<bool>(node, section, "log_sink", true);

    if (node && node["webhook"]) {
        auto webhook = node["webhook"];
        const std::string webhook_section = "alerting.webhook";
        config.webhook.enabled = readValue<bool>(webhook, webhook_section, "enabled", true);
        config.webhook.url = readValue<std::string>(webhook, webhook_section, "url", "");
        config.webhook.timeout_seconds = readPositive(webhook, webhook_section, "timeout_seconds", 5);
        config.webhook.username = readValue<std::string>(webhook, webhook_section, "username", "");
        config.webhook.password = readValue<std::string>(webhook, webhook_section, "password", "");
        config.webhook.ca_cert_path = readValue<std::string>(webhook, webhook_section, "ca_cert_path", "");
        if (config.webhook.enabled && config.webhook.url.empty()) {
            throw std::runtime_error("Invalid value for alerting.webhook.url: must not be empty");
        }
    }

    if (node && node["amqp"]) {
        auto amqp = node["amqp"];
        const std::string amqp_section = "alerting.amqp";
        config.amqp.enabled = readValue<bool>(amqp, amqp_section, "enabled", true);
        config.amqp.host = readValue<std::string>(amqp, amqp_section, "host", config.amqp.host);
        config.amqp.port = static_cast<int>(readPositive(amqp, amqp_section, "port", config.amqp.port));
        config.amqp.username = readValue<std::string>(amqp, amqp_section, "username", config.amqp.username);
        config.amqp.password = readValue<std::string>(amqp, amqp_section, "password", config.amqp.password);
        config.amqp.vhost = readValue<std::string>(amqp, amqp_section, "vhost", config.amqp.vhost);
        config.amqp.exchange = readValue<std::string>(amqp, amqp_section, "exchange", config.amqp.exchange);
        config.amqp.routing_key_prefix = readValue<std::string>(amqp, amqp_section, "routing_key_prefix", config.amqp.routing_key_prefix);
    }
    return config;
}

PipelineConfig loadPipeline(const YAML::Node& node) {
    const std::string section = "pipeline";
    PipelineConfig config;
    config.ingest_queue_size = static_cast<size_t>(readPositive(node, section, "ingest_queue_size", 4096));
    config.worker_count = static_cast<size_t>(readPositive(node, section, "worker_count", 4));
    config.worker_queue_size = static_cast<size_t>(readPositive(node, section, "worker_queue_size", 1024));
    config.ledger_queue_size = static_cast<size_t>(readPositive(node, section, "ledger_queue_size", 4096));
    config.sweep_interval = std::chrono::milliseconds(readPositive(node, section, "sweep_interval_ms", 1000));
    config.status_interval = std::chrono::seconds(readPositive(node, section, "status_interval_seconds", 60));
    return config;
}

CaptureConfig loadCapture(const YAML::Node& node) {
    const std::string section = "capture";
    CaptureConfig config;
    config.feeds = readStringList(node, section, "feeds", {});
    config.poll_interval = std::chrono::milliseconds(readPositive(node, section, "poll_interval_ms", 500));
    config.start_at_end = readValue<bool>(node, section, "start_at_end", false);
    return config;
}

YAML::Node sectionOf(const ConfigReader& reader, const std::string& name) {
    return reader.hasModuleConfig(name) ? reader.getModuleConfig(name) : YAML::Node();
}

} // namespace

std::string ruleMatchTypeToString(RuleMatchType type) {
    switch (type) {
        case RuleMatchType::EXACT: return "exact";
        case RuleMatchType::PREFIX: return "prefix";
        case RuleMatchType::GLOB: return "glob";
    }
    return "exact";
}

DefenseConfig loadDefenseConfig(const ConfigReader& reader) {
    DefenseConfig config;
    config.detection = loadDetection(sectionOf(reader, "detection"));
    config.decision = loadDecision(sectionOf(reader, "decision"));
    config.evidence = loadEvidence(sectionOf(reader, "evidence"));
    config.enforcement = loadEnforcement(sectionOf(reader, "enforcement"));
    config.alerting = loadAlerting(sectionOf(reader, "alerting"));
    config.pipeline = loadPipeline(sectionOf(reader, "pipeline"));
    config.capture = loadCapture(sectionOf(reader, "capture"));
    validateDefenseConfig(config);
    return config;
}

void validateDefenseConfig(const DefenseConfig& config) {
    if (config.detection.scan_window.count() <= 0) {
        throw std::runtime_error("Invalid value for detection.scan_window_seconds: must be positive");
    }
    if (config.detection.scan_port_threshold < 1) {
        throw std::runtime_error("Invalid value for detection.scan_port_threshold: must be at least 1");
    }
    if (config.detection.baseline_max_samples < config.detection.baseline_min_samples) {
        throw std::runtime_error("Invalid value for detection.baseline_max_samples: smaller than baseline_min_samples");
    }
    if (config.decision.block_violation_threshold < 1) {
        throw std::runtime_error("Invalid value for decision.block_violation_threshold: must be at least 1");
    }
    if (config.decision.block_base_duration.count() <= 0) {
        throw std::runtime_error("Invalid value for decision.block_base_duration: must be positive");
    }
    if (config.decision.block_escalation_cap < config.decision.block_base_duration) {
        throw std::runtime_error("Invalid value for decision.block_escalation_cap: smaller than block_base_duration");
    }
    if (config.decision.recidivism_retention_period < config.decision.violation_accounting_window) {
        throw std::runtime_error("Invalid value for decision.recidivism_retention_period: smaller than violation_accounting_window");
    }
    if (config.enforcement.max_backoff < config.enforcement.initial_backoff) {
        throw std::runtime_error("Invalid value for enforcement.max_backoff_ms: smaller than initial_backoff_ms");
    }
}

std::vector<FileSensitivityRule> defaultFileSensitivityRules() {
    std::vector<FileSensitivityRule> rules;

    FileSensitivityRule shadow;
    shadow.name = "shadow";
    shadow.pattern = "/etc/shadow";
    shadow.match_type = RuleMatchType::EXACT;
    shadow.min_severity = SeverityLevel::HIGH;
    rules.push_back(shadow);

    FileSensitivityRule passwd;
    passwd.name = "passwd";
    passwd.pattern = "/etc/passwd";
    passwd.match_type = RuleMatchType::EXACT;
    passwd.min_severity = SeverityLevel::MEDIUM;
    passwd.access_kinds = {FileAccessKind::WRITE, FileAccessKind::DELETE};
    rules.push_back(passwd);

    FileSensitivityRule sudoers;
    sudoers.name = "sudoers";
    // Covers /etc/sudoers.d/ drop-ins
    sudoers.pattern = "/etc/sudoers*";
    sudoers.match_type = RuleMatchType::GLOB;
    sudoers.min_severity = SeverityLevel::HIGH;
    rules.push_back(sudoers);

    FileSensitivityRule ssh_keys;
    ssh_keys.name = "ssh_keys";
    ssh_keys.pattern = "/home/*/.ssh/*";
    ssh_keys.match_type = RuleMatchType::GLOB;
    ssh_keys.min_severity = SeverityLevel::MEDIUM;
    rules.push_back(ssh_keys);

    return rules;
}

std::vector<std::string> defaultSuspiciousProcessNames() {
    return {
        "nc", "netcat", "nmap", "masscan", "hping", "hping3",
        "metasploit", "msfconsole", "armitage",
        "mimikatz", "procdump", "pwdump", "keylogger",
        "cryptominer", "xmrig", "minergate",
        "backdoor", "trojan", "rootkit"
    };
}

} // namespace config
} // namespace sovereign_defense
