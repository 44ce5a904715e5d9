#pragma once

#include "modules/config/defense_config.hpp"
#include "modules/evidence/evidence_record.hpp"
#include "modules/logging/logging_module.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <fstream>
#include <shared_mutex>
#include <cstdint>

namespace sovereign_defense {
namespace evidence {

/**
 * @brief Sequential reader over a committed range of records
 */
class RecordReader {
public:
    virtual ~RecordReader() = default;

    /**
     * @return Next record, std::nullopt at the end of the range
     * @throws LedgerCorruptionError if a stored record cannot be decoded
     */
    virtual std::optional<EvidenceRecord> next() = 0;
};

/**
 * @brief Durable home of the committed records
 *
 * Only the ledger writer calls append(). Readers may run concurrently with it
 * and only ever see fully committed records.
 */
class LedgerStorage {
public:
    virtual ~LedgerStorage() = default;

    /**
     * @throws LedgerWriteError when the record could not be committed
     */
    virtual void append(const EvidenceRecord& record) = 0;

    virtual void flush() = 0;

    /**
     * @brief Number of committed records (also the last sequence number)
     */
    virtual uint64_t size() const = 0;

    /**
     * @brief Opens a reader over sequences [first, last]
     */
    virtual std::unique_ptr<RecordReader> openReader(uint64_t first, uint64_t last) const = 0;
};

/**
 * @brief In-process storage, used for tests and ephemeral runs
 */
class MemoryLedgerStorage : public LedgerStorage {
public:
    void append(const EvidenceRecord& record) override;
    void flush() override {}
    uint64_t size() const override;
    std::unique_ptr<RecordReader> openReader(uint64_t first, uint64_t last) const override;

private:
    class Reader;

    mutable std::shared_mutex mutex_;
    std::vector<EvidenceRecord> records_;
};

/**
 * @brief Append-only JSON-lines file, one record per line
 *
 * Opening the file indexes the line offsets. A trailing line without its
 * newline is the remains of an interrupted write; it was never committed and
 * is cut off.
 */
class FileLedgerStorage : public LedgerStorage {
public:
    /**
     * @throws LedgerError if the file cannot be opened or recovered
     */
    explicit FileLedgerStorage(const std::string& path,
                               std::shared_ptr<logging::LoggingModule> logging_module = nullptr);
    ~FileLedgerStorage() override;

    void append(const EvidenceRecord& record) override;
    void flush() override;
    uint64_t size() const override;
    std::unique_ptr<RecordReader> openReader(uint64_t first, uint64_t last) const override;

    const std::string& getPath() const { return path_; }

    // Bytes cut off during recovery of an interrupted write
    uint64_t recoveredBytes() const { return recovered_bytes_; }

private:
    class Reader;

    void recover();

    std::string path_;
    std::shared_ptr<logging::LoggingModule> logging_module_;
    std::ofstream output_;
    uint64_t end_offset_ = 0;
    uint64_t recovered_bytes_ = 0;
    bool failed_ = false;

    mutable std::shared_mutex mutex_;
    std::vector<uint64_t> offsets_;
};

/**
 * @brief Builds the storage selected by the evidence configuration
 */
std::shared_ptr<LedgerStorage> createLedgerStorage(const config::EvidenceConfig& config,
                                                   std::shared_ptr<logging::LoggingModule> logging_module = nullptr);

} // namespace evidence
} // namespace sovereign_defense
