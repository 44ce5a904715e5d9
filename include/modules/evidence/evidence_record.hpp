#pragma once

#include "modules/event_management/security_event.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace sovereign_defense {
namespace evidence {

/**
 * @brief Committed, hash-chained ledger entry wrapping one SecurityEvent
 *
 * Sequence numbers start at 1 and are contiguous. previous_hash of the
 * first record is the genesis hash.
 */
struct EvidenceRecord {
    uint64_t sequence;
    event_management::SecurityEvent event;
    std::string previous_hash;
    std::string record_hash;

    /**
     * @brief Export schema: sequence, timestamp, kind, source, severity,
     *        score, payload, record_hash, previous_hash
     */
    nlohmann::json toJson() const;

    /**
     * @throws nlohmann::json::exception or std::invalid_argument on malformed input
     */
    static EvidenceRecord fromJson(const nlohmann::json& json);
};

/**
 * @brief Computes record hashes: SHA-256, or HMAC-SHA256 when a key is set
 *
 * The digest covers "sequence|canonical event JSON|previous hash".
 */
class RecordHasher {
public:
    explicit RecordHasher(const std::string& hmac_key = "");

    std::string hash(uint64_t sequence,
                     const event_management::SecurityEvent& event,
                     const std::string& previous_hash) const;

    bool isKeyed() const { return !hmac_key_.empty(); }

    /**
     * @brief Previous hash of the first record: 64 '0' characters
     */
    static const std::string& genesisHash();

private:
    std::string hmac_key_;
};

} // namespace evidence
} // namespace sovereign_defense
