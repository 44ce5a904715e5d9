#include "modules/evidence/evidence_ledger.hpp"
#include <algorithm>

namespace sovereign_defense {
namespace evidence {

using logging::LogLevel;

bool EvidenceQuery::matches(const EvidenceRecord& record) const {
    const auto& event = record.event;
    if (source && event.getSource() != *source) {
        return false;
    }
    if (kind && event.getKind() != *kind) {
        return false;
    }
    if (min_severity && event.getSeverity() < *min_severity) {
        return false;
    }
    if (from_time && event.getTimestamp() < *from_time) {
        return false;
    }
    if (to_time && event.getTimestamp() > *to_time) {
        return false;
    }
    return true;
}

EvidenceCursor::EvidenceCursor(std::shared_ptr<const LedgerStorage> storage, EvidenceQuery query, uint64_t last_sequence)
    : storage_(std::move(storage)), query_(std::move(query)), last_sequence_(last_sequence) {
    if (query_.to_sequence) {
        last_sequence_ = std::min(last_sequence_, *query_.to_sequence);
    }
}

std::optional<EvidenceRecord> EvidenceCursor::next() {
    if (!reader_) {
        uint64_t first = query_.from_sequence ? std::max<uint64_t>(*query_.from_sequence, 1) : 1;
        reader_ = storage_->openReader(first, last_sequence_);
    }
    while (auto record = reader_->next()) {
        if (query_.matches(*record)) {
            return record;
        }
    }
    return std::nullopt;
}

void EvidenceCursor::rewind() {
    reader_.reset();
}

EvidenceLedger::EvidenceLedger(std::shared_ptr<LedgerStorage> storage,
                               const config::EvidenceConfig& config,
                               std::shared_ptr<logging::LoggingModule> logging_module)
    : storage_(std::move(storage))
    , hasher_(config.hmac_key)
    , logging_module_(std::move(logging_module))
    , head_hash_(RecordHasher::genesisHash()) {
    if (!storage_) {
        throw LedgerError("Evidence ledger requires a storage backend");
    }

    uint64_t committed = storage_->size();
    next_sequence_ = committed + 1;
    if (committed > 0) {
        try {
            auto last = storage_->openReader(committed, committed)->next();
            if (last) {
                head_hash_ = last->record_hash;
            }
        } catch (const LedgerCorruptionError& e) {
            halt(e.what());
        }
    }
}

EvidenceRecord EvidenceLedger::append(const event_management::SecurityEvent& event) {
    std::lock_guard<std::mutex> lock(append_mutex_);
    if (halted_) {
        throw LedgerHaltedError("Evidence ledger halted: " + haltReason());
    }

    uint64_t sequence = next_sequence_;
    EvidenceRecord record{sequence, event, head_hash_, ""};
    try {
        record.record_hash = hasher_.hash(sequence, event, head_hash_);
        storage_->append(record);
    } catch (const LedgerWriteError& e) {
        halt(e.what());
        throw;
    } catch (const LedgerError& e) {
        halt(e.what());
        throw LedgerWriteError(e.what());
    }

    head_hash_ = record.record_hash;
    ++next_sequence_;
    return record;
}

bool EvidenceLedger::verify(uint64_t from, uint64_t to) {
    if (from == 0) {
        from = 1;
    }
    if (from > to) {
        return true;
    }
    if (to > size()) {
        return false;
    }
    return verifyChain(to).intact;
}

VerificationResult EvidenceLedger::verifyChain(uint64_t to) {
    VerificationResult result;
    uint64_t last = std::min(to, size());

    std::string expected_previous = RecordHasher::genesisHash();
    uint64_t expected_sequence = 1;

    try {
        auto reader = storage_->openReader(1, last);
        while (auto record = reader->next()) {
            if (record->sequence != expected_sequence) {
                result.intact = false;
                result.first_broken_sequence = expected_sequence;
                result.reason = "sequence gap: expected " + std::to_string(expected_sequence) +
                                ", found " + std::to_string(record->sequence);
                break;
            }
            if (record->previous_hash != expected_previous) {
                result.intact = false;
                result.first_broken_sequence = record->sequence;
                result.reason = "previous hash does not match record " + std::to_string(record->sequence - 1);
                break;
            }
            if (hasher_.hash(record->sequence, record->event, record->previous_hash) != record->record_hash) {
                result.intact = false;
                result.first_broken_sequence = record->sequence;
                result.reason = "record hash mismatch";
                break;
            }
            expected_previous = record->record_hash;
            ++expected_sequence;
            ++result.records_checked;
        }
    } catch (const LedgerCorruptionError& e) {
        result.intact = false;
        result.first_broken_sequence = e.getSequence();
        result.reason = e.what();
    } catch (const LedgerError& e) {
        result.intact = false;
        result.first_broken_sequence = expected_sequence;
        result.reason = e.what();
    }

    if (result.intact && result.records_checked != last) {
        result.intact = false;
        result.first_broken_sequence = expected_sequence;
        result.reason = "ledger ended before record " + std::to_string(expected_sequence);
    }

    if (!result.intact) {
        halt("chain broken at record " + std::to_string(*result.first_broken_sequence) + ": " + result.reason);
    } else if (logging_module_) {
        logging_module_->log(LogLevel::DEBUG, "EvidenceLedger", "verifyChain",
                             "Verified " + std::to_string(result.records_checked) + " records",
                             __FILE__, __FUNCTION__, std::to_string(__LINE__));
    }
    return result;
}

EvidenceCursor EvidenceLedger::query(const EvidenceQuery& query) const {
    return EvidenceCursor(storage_, query, size());
}

uint64_t EvidenceLedger::size() const {
    return storage_->size();
}

std::string EvidenceLedger::headHash() const {
    std::lock_guard<std::mutex> lock(append_mutex_);
    return head_hash_;
}

std::string EvidenceLedger::haltReason() const {
    std::lock_guard<std::mutex> lock(halt_mutex_);
    return halt_reason_;
}

void EvidenceLedger::halt(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(halt_mutex_);
        if (halted_) {
            return;
        }
        halt_reason_ = reason;
        halted_ = true;
    }
    if (logging_module_) {
        logging_module_->log(LogLevel::CRITICAL, "EvidenceLedger", "halt",
                             "Evidence ledger halted: " + reason,
                             __FILE__, __FUNCTION__, std::to_string(__LINE__));
    }
}

void EvidenceLedger::flush() {
    std::lock_guard<std::mutex> lock(append_mutex_);
    try {
        storage_->flush();
    } catch (const LedgerWriteError& e) {
        halt(e.what());
        throw;
    }
}

} // namespace evidence
} // namespace sovereign_defense
