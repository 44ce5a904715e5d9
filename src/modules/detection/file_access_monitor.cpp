#include "modules/detection/file_access_monitor.hpp"
#include <fnmatch.h>
#include <algorithm>

namespace sovereign_defense {
namespace detection {

using event_management::FileAccessEvent;
using event_management::FileAccessKind;
using event_management::SecurityEvent;
using event_management::SecurityEventKind;
using event_management::SeverityLevel;
using event_management::TimePoint;
using logging::LogLevel;

namespace {

double severityScore(SeverityLevel severity) {
    switch (severity) {
        case SeverityLevel::LOW: return 0.2;
        case SeverityLevel::MEDIUM: return 0.45;
        case SeverityLevel::HIGH: return 0.75;
        case SeverityLevel::CRITICAL: return 1.0;
    }
    return 0.2;
}

} // namespace

SeverityLevel accessKindSeverity(FileAccessKind kind) {
    switch (kind) {
        case FileAccessKind::READ: return SeverityLevel::LOW;
        case FileAccessKind::EXECUTE: return SeverityLevel::MEDIUM;
        case FileAccessKind::WRITE: return SeverityLevel::HIGH;
        case FileAccessKind::DELETE: return SeverityLevel::CRITICAL;
    }
    return SeverityLevel::LOW;
}

FileAccessMonitor::FileAccessMonitor(const config::DetectionConfig& config,
                                     std::shared_ptr<logging::LoggingModule> logging_module,
                                     size_t shard_count)
    : rules_(config.file_sensitivity_rules)
    , dedup_window_(config.file_dedup_window)
    , logging_module_(std::move(logging_module))
    , recent_(shard_count) {}

bool FileAccessMonitor::matches(const config::FileSensitivityRule& rule, const std::string& path) {
    switch (rule.match_type) {
        case config::RuleMatchType::EXACT:
            return path == rule.pattern;
        case config::RuleMatchType::PREFIX: {
            if (path.compare(0, rule.pattern.size(), rule.pattern) != 0) {
                return false;
            }
            // Only whole path components: /home/u/.ssh must not match /home/u/.ssh_old
            return rule.pattern.empty() || rule.pattern.back() == '/' ||
                   path.size() == rule.pattern.size() || path[rule.pattern.size()] == '/';
        }
        case config::RuleMatchType::GLOB:
            return fnmatch(rule.pattern.c_str(), path.c_str(), 0) == 0;
    }
    return false;
}

std::optional<config::FileSensitivityRule> FileAccessMonitor::matchRule(const FileAccessEvent& event) const {
    const config::FileSensitivityRule* best = nullptr;
    for (const auto& rule : rules_) {
        if (!rule.access_kinds.empty() && rule.access_kinds.count(event.access_kind) == 0) {
            continue;
        }
        if (!matches(rule, event.path)) {
            continue;
        }
        if (!best || rule.min_severity > best->min_severity) {
            best = &rule;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return *best;
}

std::optional<SecurityEvent> FileAccessMonitor::observe(const FileAccessEvent& event) {
    auto rule = matchRule(event);
    if (!rule) {
        return std::nullopt;
    }

    auto source = event.source();
    if (dedup_window_.count() > 0) {
        const std::string key = event_management::accessKindToString(event.access_kind) + ":" + event.path;
        bool duplicate = recent_.withEntry(source, [&](DedupTable& table) {
            auto it = table.find(key);
            if (it != table.end() && event.timestamp >= it->second &&
                event.timestamp < it->second + dedup_window_) {
                return true;
            }
            table[key] = event.timestamp;
            return false;
        });
        if (duplicate) {
            ++suppressed_;
            return std::nullopt;
        }
    }

    SeverityLevel severity = std::max(rule->min_severity, accessKindSeverity(event.access_kind));

    nlohmann::json payload;
    payload["path"] = event.path;
    payload["access_kind"] = event_management::accessKindToString(event.access_kind);
    payload["pid"] = event.pid;
    if (event.process_path) {
        payload["process_path"] = *event.process_path;
    }
    payload["rule"] = rule->name;
    payload["rule_pattern"] = rule->pattern;
    payload["rule_match"] = config::ruleMatchTypeToString(rule->match_type);
    payload["rule_min_severity"] = event_management::severityToString(rule->min_severity);

    SecurityEvent security_event(SecurityEventKind::SENSITIVE_FILE_ACCESS,
                                 source,
                                 severity,
                                 severityScore(severity),
                                 payload,
                                 event.timestamp);

    if (logging_module_) {
        logging_module_->log(LogLevel::INFO, "FileAccessMonitor", "observe",
                             "Sensitive file access: " + event.path + " (" +
                             event_management::accessKindToString(event.access_kind) + ")",
                             __FILE__, __FUNCTION__, std::to_string(__LINE__), payload);
    }
    return security_event;
}

size_t FileAccessMonitor::sweep(TimePoint now) {
    recent_.forEach([&](const event_management::SourceIdentity&, DedupTable& table) {
        for (auto it = table.begin(); it != table.end();) {
            if (it->second + dedup_window_ <= now) {
                it = table.erase(it);
            } else {
                ++it;
            }
        }
    });
    return recent_.eraseIf([](const event_management::SourceIdentity&, const DedupTable& table) {
        return table.empty();
    });
}

} // namespace detection
} // namespace sovereign_defense
