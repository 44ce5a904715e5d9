#pragma once

#include "modules/config/defense_config.hpp"
#include "modules/detection/address_matcher.hpp"
#include "modules/event_management/observation.hpp"
#include "modules/event_management/security_event.hpp"
#include "modules/event_management/sharded_map.hpp"
#include "modules/logging/logging_module.hpp"
#include <set>
#include <string>
#include <memory>
#include <optional>
#include <unordered_map>
#include <atomic>

namespace sovereign_defense {
namespace detection {

/**
 * @brief Outcome of the layered connection policy
 */
enum class PolicyVerdict {
    ALLOWED,            // explicit allow-list entry
    DENIED,             // explicit deny-list entry
    IGNORED_LOCAL,      // loopback or configured local address
    OUTBOUND,           // default policy only covers inbound traffic
    EXPECTED_SERVICE,   // inbound to a configured service port
    UNEXPECTED_SERVICE  // inbound to any other port
};

std::string policyVerdictToString(PolicyVerdict verdict);

/**
 * @brief Classifies connection attempts against allow/deny/expected-service policy
 */
class ConnectionPolicyEvaluator {
public:
    /**
     * @throws std::invalid_argument on a malformed allow/deny/local entry
     */
    ConnectionPolicyEvaluator(const config::DetectionConfig& config,
                              std::shared_ptr<logging::LoggingModule> logging_module = nullptr,
                              size_t shard_count = 16);

    /**
     * @brief Pure policy classification, no dedup state involved
     */
    PolicyVerdict classify(const event_management::NetworkEvent& event) const;

    /**
     * @brief Classifies the event and emits UNAUTHORIZED_CONNECTION when flagged
     *
     * A connection (source address and port, destination port, protocol)
     * that was already flagged is not flagged again while packets keep
     * arriving within the dedup window.
     */
    std::optional<event_management::SecurityEvent> evaluate(const event_management::NetworkEvent& event);

    /**
     * @brief Forgets dedup entries that have not been seen for a full window
     */
    size_t sweep(event_management::TimePoint now);

    uint64_t suppressedDuplicates() const { return suppressed_.load(); }

private:
    using DedupTable = std::unordered_map<std::string, event_management::TimePoint>;

    static std::string connectionKey(const event_management::NetworkEvent& event);

    AddressMatcher allow_list_;
    AddressMatcher deny_list_;
    AddressMatcher local_addresses_;
    std::set<uint16_t> expected_ports_;
    std::chrono::seconds dedup_window_;
    bool ignore_loopback_;
    std::shared_ptr<logging::LoggingModule> logging_module_;
    event_management::ShardedMap<DedupTable> flagged_;
    std::atomic<uint64_t> suppressed_{0};
};

} // namespace detection
} // namespace sovereign_defense
