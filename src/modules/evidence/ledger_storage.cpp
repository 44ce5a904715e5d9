#include "modules/evidence/ledger_storage.hpp"
#include "modules/evidence/ledger_error.hpp"
#include <filesystem>
#include <mutex>
#include <algorithm>

namespace sovereign_defense {
namespace evidence {

using logging::LogLevel;

class MemoryLedgerStorage::Reader : public RecordReader {
public:
    Reader(const MemoryLedgerStorage& storage, uint64_t first, uint64_t last)
        : storage_(storage), next_(first), last_(last) {}

    std::optional<EvidenceRecord> next() override {
        if (next_ == 0 || next_ > last_) {
            return std::nullopt;
        }
        std::shared_lock<std::shared_mutex> lock(storage_.mutex_);
        if (next_ > storage_.records_.size()) {
            return std::nullopt;
        }
        return storage_.records_[static_cast<size_t>(next_++ - 1)];
    }

private:
    const MemoryLedgerStorage& storage_;
    uint64_t next_;
    uint64_t last_;
};

void MemoryLedgerStorage::append(const EvidenceRecord& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    records_.push_back(record);
}

uint64_t MemoryLedgerStorage::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

std::unique_ptr<RecordReader> MemoryLedgerStorage::openReader(uint64_t first, uint64_t last) const {
    return std::make_unique<Reader>(*this, first == 0 ? 1 : first, std::min(last, size()));
}

class FileLedgerStorage::Reader : public RecordReader {
public:
    Reader(const std::string& path, uint64_t start_offset, uint64_t first, uint64_t last)
        : next_(first), last_(last) {
        if (next_ <= last_) {
            input_.open(path, std::ios::binary);
            if (!input_.is_open()) {
                throw LedgerError("Failed to open ledger for reading: " + path);
            }
            input_.seekg(static_cast<std::streamoff>(start_offset));
        }
    }

    std::optional<EvidenceRecord> next() override {
        if (next_ == 0 || next_ > last_) {
            return std::nullopt;
        }

        std::string line;
        do {
            if (!std::getline(input_, line)) {
                throw LedgerCorruptionError(next_, "Ledger ended before record " + std::to_string(next_));
            }
        } while (line.empty());

        uint64_t sequence = next_++;
        try {
            return EvidenceRecord::fromJson(nlohmann::json::parse(line));
        } catch (const std::exception& e) {
            throw LedgerCorruptionError(sequence, "Undecodable record " + std::to_string(sequence) + ": " + e.what());
        }
    }

private:
    std::ifstream input_;
    uint64_t next_;
    uint64_t last_;
};

FileLedgerStorage::FileLedgerStorage(const std::string& path,
                                     std::shared_ptr<logging::LoggingModule> logging_module)
    : path_(path), logging_module_(std::move(logging_module)) {
    recover();
}

FileLedgerStorage::~FileLedgerStorage() {
    if (output_.is_open()) {
        output_.flush();
        output_.close();
    }
}

void FileLedgerStorage::recover() {
    try {
        std::filesystem::path ledger_path(path_);
        if (ledger_path.has_parent_path()) {
            std::filesystem::create_directories(ledger_path.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw LedgerError("Failed to create ledger directory: " + std::string(e.what()));
    }

    if (std::filesystem::exists(path_)) {
        std::ifstream input(path_, std::ios::binary);
        if (!input.is_open()) {
            throw LedgerError("Failed to open ledger: " + path_);
        }

        uint64_t offset = 0;
        std::string line;
        while (std::getline(input, line)) {
            if (input.eof()) {
                // Last line has no newline: the write never completed
                recovered_bytes_ = line.size();
                break;
            }
            if (!line.empty()) {
                offsets_.push_back(offset);
            }
            offset += line.size() + 1;
        }
        input.close();

        if (recovered_bytes_ > 0) {
            std::error_code error;
            std::filesystem::resize_file(path_, offset, error);
            if (error) {
                throw LedgerError("Failed to truncate interrupted record in " + path_ + ": " + error.message());
            }
            if (logging_module_) {
                logging_module_->log(LogLevel::WARNING, "FileLedgerStorage", "recover",
                                     "Removed " + std::to_string(recovered_bytes_) +
                                     " bytes of an interrupted write from " + path_,
                                     __FILE__, __FUNCTION__, std::to_string(__LINE__));
            }
        }
        end_offset_ = offset;
    }

    output_.open(path_, std::ios::binary | std::ios::app);
    if (!output_.is_open()) {
        throw LedgerError("Failed to open ledger for writing: " + path_);
    }

    if (logging_module_) {
        logging_module_->log(LogLevel::INFO, "FileLedgerStorage", "recover",
                             "Opened ledger " + path_ + " with " + std::to_string(offsets_.size()) + " records",
                             __FILE__, __FUNCTION__, std::to_string(__LINE__));
    }
}

void FileLedgerStorage::append(const EvidenceRecord& record) {
    if (failed_) {
        throw LedgerWriteError("Ledger storage is in a failed state: " + path_);
    }

    std::string line = record.toJson().dump() + "\n";
    output_.write(line.data(), static_cast<std::streamsize>(line.size()));
    output_.flush();
    if (!output_) {
        failed_ = true;
        throw LedgerWriteError("Failed to write record " + std::to_string(record.sequence) + " to " + path_);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    offsets_.push_back(end_offset_);
    end_offset_ += line.size();
}

void FileLedgerStorage::flush() {
    output_.flush();
    if (!output_) {
        failed_ = true;
        throw LedgerWriteError("Failed to flush ledger " + path_);
    }
}

uint64_t FileLedgerStorage::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return offsets_.size();
}

std::unique_ptr<RecordReader> FileLedgerStorage::openReader(uint64_t first, uint64_t last) const {
    if (first == 0) {
        first = 1;
    }
    uint64_t start_offset = 0;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        last = std::min<uint64_t>(last, offsets_.size());
        if (first <= last) {
            start_offset = offsets_[static_cast<size_t>(first - 1)];
        }
    }
    return std::make_unique<Reader>(path_, start_offset, first, last);
}

std::shared_ptr<LedgerStorage> createLedgerStorage(const config::EvidenceConfig& config,
                                                   std::shared_ptr<logging::LoggingModule> logging_module) {
    if (config.storage == "memory") {
        return std::make_shared<MemoryLedgerStorage>();
    }
    return std::make_shared<FileLedgerStorage>(config.ledger_path, std::move(logging_module));
}

} // namespace evidence
} // namespace sovereign_defense
