#include "modules/detection/connection_policy_evaluator.hpp"
#include <algorithm>

namespace sovereign_defense {
namespace detection {

using event_management::NetworkEvent;
using event_management::SecurityEvent;
using event_management::SecurityEventKind;
using event_management::TimePoint;
using logging::LogLevel;

std::string policyVerdictToString(PolicyVerdict verdict) {
    switch (verdict) {
        case PolicyVerdict::ALLOWED: return "allowed";
        case PolicyVerdict::DENIED: return "denied";
        case PolicyVerdict::IGNORED_LOCAL: return "ignored_local";
        case PolicyVerdict::OUTBOUND: return "outbound";
        case PolicyVerdict::EXPECTED_SERVICE: return "expected_service";
        case PolicyVerdict::UNEXPECTED_SERVICE: return "unexpected_service";
    }
    return "allowed";
}

ConnectionPolicyEvaluator::ConnectionPolicyEvaluator(const config::DetectionConfig& config,
                                                     std::shared_ptr<logging::LoggingModule> logging_module,
                                                     size_t shard_count)
    : allow_list_(config.connection_allow_list)
    , deny_list_(config.connection_deny_list)
    , local_addresses_(config.local_addresses)
    , expected_ports_(config.expected_service_ports)
    , dedup_window_(config.connection_dedup_window)
    , ignore_loopback_(config.ignore_loopback)
    , logging_module_(std::move(logging_module))
    , flagged_(shard_count) {}

PolicyVerdict ConnectionPolicyEvaluator::classify(const NetworkEvent& event) const {
    const std::string& address = event.source.getValue();

    if (allow_list_.matches(address)) {
        return PolicyVerdict::ALLOWED;
    }
    if (deny_list_.matches(address)) {
        return PolicyVerdict::DENIED;
    }
    if ((ignore_loopback_ && isLoopbackAddress(address)) || local_addresses_.matches(address)) {
        return PolicyVerdict::IGNORED_LOCAL;
    }
    if (event.direction != event_management::TrafficDirection::INBOUND) {
        return PolicyVerdict::OUTBOUND;
    }
    if (expected_ports_.count(event.destination_port) > 0) {
        return PolicyVerdict::EXPECTED_SERVICE;
    }
    return PolicyVerdict::UNEXPECTED_SERVICE;
}

std::string ConnectionPolicyEvaluator::connectionKey(const NetworkEvent& event) {
    std::string key = event.source.getPort() ? std::to_string(*event.source.getPort()) : "*";
    key += ">" + std::to_string(event.destination_port);
    key += "/" + event_management::protocolToString(event.protocol);
    return key;
}

std::optional<SecurityEvent> ConnectionPolicyEvaluator::evaluate(const NetworkEvent& event) {
    PolicyVerdict verdict = classify(event);
    if (verdict != PolicyVerdict::DENIED && verdict != PolicyVerdict::UNEXPECTED_SERVICE) {
        return std::nullopt;
    }

    const std::string key = connectionKey(event);
    bool duplicate = flagged_.withEntry(event.source, [&](DedupTable& table) {
        auto it = table.find(key);
        if (it != table.end() && event.timestamp < it->second + dedup_window_) {
            // Packets of a flagged connection keep it suppressed
            it->second = std::max(it->second, event.timestamp);
            return true;
        }
        table[key] = event.timestamp;
        return false;
    });

    if (duplicate) {
        ++suppressed_;
        return std::nullopt;
    }

    double score = 1.0;
    if (verdict == PolicyVerdict::UNEXPECTED_SERVICE) {
        score = event.destination_port < 1024 ? 0.7 : 0.45;
    }

    nlohmann::json payload;
    payload["verdict"] = policyVerdictToString(verdict);
    payload["destination_address"] = event.destination_address;
    payload["destination_port"] = event.destination_port;
    payload["protocol"] = event_management::protocolToString(event.protocol);
    payload["direction"] = event_management::directionToString(event.direction);
    if (event.source.getPort()) {
        payload["source_port"] = *event.source.getPort();
    }

    SecurityEvent security_event(SecurityEventKind::UNAUTHORIZED_CONNECTION,
                                 event.source,
                                 verdict == PolicyVerdict::DENIED ?
                                     event_management::SeverityLevel::CRITICAL :
                                     event_management::severityForScore(score),
                                 score,
                                 payload,
                                 event.timestamp);

    if (logging_module_) {
        logging_module_->log(LogLevel::INFO, "ConnectionPolicyEvaluator", "evaluate",
                             "Unauthorized connection from " + event.source.getValue() +
                             " to port " + std::to_string(event.destination_port),
                             __FILE__, __FUNCTION__, std::to_string(__LINE__), payload);
    }
    return security_event;
}

size_t ConnectionPolicyEvaluator::sweep(TimePoint now) {
    flagged_.forEach([&](const event_management::SourceIdentity&, DedupTable& table) {
        for (auto it = table.begin(); it != table.end();) {
            if (it->second + dedup_window_ <= now) {
                it = table.erase(it);
            } else {
                ++it;
            }
        }
    });
    return flagged_.eraseIf([](const event_management::SourceIdentity&, const DedupTable& table) {
        return table.empty();
    });
}

} // namespace detection
} // namespace sovereign_defense
