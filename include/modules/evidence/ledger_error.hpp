#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace sovereign_defense {
namespace evidence {

/**
 * @brief Base class of every evidence ledger failure
 */
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Storage layer failed while committing a record
 *
 * Fatal for the ledger: it halts and refuses further appends.
 */
class LedgerWriteError : public LedgerError {
public:
    explicit LedgerWriteError(const std::string& message)
        : LedgerError(message) {}
};

/**
 * @brief Append attempted after the ledger halted
 */
class LedgerHaltedError : public LedgerError {
public:
    explicit LedgerHaltedError(const std::string& message)
        : LedgerError(message) {}
};

/**
 * @brief A stored record could not be decoded
 */
class LedgerCorruptionError : public LedgerError {
public:
    LedgerCorruptionError(uint64_t sequence, const std::string& message)
        : LedgerError(message), sequence_(sequence) {}

    uint64_t getSequence() const { return sequence_; }

private:
    uint64_t sequence_;
};

} // namespace evidence
} // namespace sovereign_defense
