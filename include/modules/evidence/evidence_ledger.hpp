#pragma once

#include "modules/config/defense_config.hpp"
#include "modules/evidence/evidence_record.hpp"
#include "modules/evidence/ledger_error.hpp"
#include "modules/evidence/ledger_storage.hpp"
#include "modules/logging/logging_module.hpp"
#include <string>
#include <memory>
#include <optional>
#include <mutex>
#include <atomic>
#include <limits>
#include <cstdint>

namespace sovereign_defense {
namespace evidence {

/**
 * @brief Filters of a ledger query; unset fields match everything
 */
struct EvidenceQuery {
    std::optional<event_management::SourceIdentity> source;
    std::optional<event_management::SecurityEventKind> kind;
    std::optional<event_management::SeverityLevel> min_severity;
    std::optional<event_management::TimePoint> from_time;
    std::optional<event_management::TimePoint> to_time;
    std::optional<uint64_t> from_sequence;
    std::optional<uint64_t> to_sequence;

    bool matches(const EvidenceRecord& record) const;
};

/**
 * @brief Lazy, restartable sequence of records matching a query
 *
 * Bound to the committed prefix that existed when the query was made;
 * records appended later are not visited. Records are read from storage one
 * at a time.
 */
class EvidenceCursor {
public:
    EvidenceCursor(std::shared_ptr<const LedgerStorage> storage, EvidenceQuery query, uint64_t last_sequence);

    /**
     * @return Next matching record, std::nullopt when exhausted
     * @throws LedgerCorruptionError if a stored record cannot be decoded
     */
    std::optional<EvidenceRecord> next();

    /**
     * @brief Restarts the sequence from its first record
     */
    void rewind();

    uint64_t lastSequence() const { return last_sequence_; }

private:
    std::shared_ptr<const LedgerStorage> storage_;
    EvidenceQuery query_;
    uint64_t last_sequence_;
    std::unique_ptr<RecordReader> reader_;
};

/**
 * @brief Outcome of a chain verification
 */
struct VerificationResult {
    bool intact = true;
    uint64_t records_checked = 0;
    std::optional<uint64_t> first_broken_sequence;
    std::string reason;
};

/**
 * @brief Append-only, hash-chained store of security events
 *
 * append() must be called from a single writer. Readers (verify, query) work
 * on the committed prefix and never block the writer. Any storage failure or
 * detected chain break halts the ledger: further appends throw
 * LedgerHaltedError while committed records stay readable.
 */
class EvidenceLedger {
public:
    EvidenceLedger(std::shared_ptr<LedgerStorage> storage,
                   const config::EvidenceConfig& config,
                   std::shared_ptr<logging::LoggingModule> logging_module = nullptr);

    /**
     * @brief Commits an event as the next record of the chain
     *
     * @throws LedgerWriteError on storage failure (the ledger halts)
     * @throws LedgerHaltedError if the ledger already halted
     */
    EvidenceRecord append(const event_management::SecurityEvent& event);

    /**
     * @brief Checks that records [from, to] and the chain leading to them are intact
     *
     * A mismatch halts the ledger.
     */
    bool verify(uint64_t from, uint64_t to);

    /**
     * @brief Verifies the whole committed chain
     */
    bool verify() { return verify(1, size()); }

    /**
     * @brief Like verify(), reporting where and why the chain broke
     */
    VerificationResult verifyChain(uint64_t to = std::numeric_limits<uint64_t>::max());

    EvidenceCursor query(const EvidenceQuery& query) const;

    uint64_t size() const;
    std::string headHash() const;

    bool isHalted() const { return halted_.load(); }
    std::string haltReason() const;

    /**
     * @brief Stops further appends; idempotent
     */
    void halt(const std::string& reason);

    void flush();

private:
    std::shared_ptr<LedgerStorage> storage_;
    RecordHasher hasher_;
    std::shared_ptr<logging::LoggingModule> logging_module_;

    mutable std::mutex append_mutex_;
    std::string head_hash_;
    uint64_t next_sequence_ = 1;

    std::atomic<bool> halted_{false};
    mutable std::mutex halt_mutex_;
    std::string halt_reason_;
};

} // namespace evidence
} // namespace sovereign_defense
