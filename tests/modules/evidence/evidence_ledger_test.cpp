#include "modules/evidence/evidence_ledger.hpp"
#include "modules/evidence/ledger_error.hpp"
#include "modules/evidence/ledger_storage.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace testing;
using namespace sovereign_defense::evidence;
using namespace sovereign_defense::event_management;
using sovereign_defense::config::EvidenceConfig;

class MockLedgerStorage : public LedgerStorage {
public:
    MOCK_METHOD(void, append, (const EvidenceRecord& record), (override));
    MOCK_METHOD(void, flush, (), (override));
    MOCK_METHOD(uint64_t, size, (), (const, override));
    MOCK_METHOD(std::unique_ptr<RecordReader>, openReader, (uint64_t first, uint64_t last), (const, override));
};

namespace {

SecurityEvent makeEvent(const std::string& address, SecurityEventKind kind, SeverityLevel severity, int seconds) {
    return SecurityEvent(kind,
                         SourceIdentity::network(address),
                         severity,
                         0.75,
                         nlohmann::json{{"distinct_ports", 3 + seconds}},
                         fromMillis(1700000000000 + seconds * 1000LL));
}

} // namespace

class EvidenceLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "sovereign_defense_ledger_test";
        std::filesystem::remove_all(test_dir_);
        ledger_path_ = (test_dir_ / "evidence.ledger").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::shared_ptr<EvidenceLedger> openFileLedger(const std::string& hmac_key = "") {
        EvidenceConfig config;
        config.hmac_key = hmac_key;
        return std::make_shared<EvidenceLedger>(std::make_shared<FileLedgerStorage>(ledger_path_), config);
    }

    void appendScans(EvidenceLedger& ledger, int count) {
        for (int i = 0; i < count; ++i) {
            ledger.append(makeEvent("10.0.0." + std::to_string(i % 2 + 5), SecurityEventKind::PORT_SCAN,
                                    SeverityLevel::HIGH, i));
        }
    }

    std::vector<std::string> readLines() {
        std::ifstream input(ledger_path_);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(input, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    void writeLines(const std::vector<std::string>& lines) {
        std::ofstream output(ledger_path_, std::ios::trunc);
        for (const auto& line : lines) {
            output << line << "\n";
        }
    }

    std::filesystem::path test_dir_;
    std::string ledger_path_;
};

TEST_F(EvidenceLedgerTest, AppendChainsRecords) {
    auto ledger = openFileLedger();
    auto first = ledger->append(makeEvent("10.0.0.5", SecurityEventKind::PORT_SCAN, SeverityLevel::HIGH, 0));
    auto second = ledger->append(makeEvent("10.0.0.5", SecurityEventKind::PORT_SCAN, SeverityLevel::HIGH, 1));

    EXPECT_EQ(first.sequence, 1u);
    EXPECT_EQ(first.previous_hash, RecordHasher::genesisHash());
    EXPECT_EQ(first.record_hash.size(), 64u);
    EXPECT_EQ(second.sequence, 2u);
    EXPECT_EQ(second.previous_hash, first.record_hash);
    EXPECT_EQ(ledger->headHash(), second.record_hash);
    EXPECT_EQ(ledger->size(), 2u);
    EXPECT_TRUE(ledger->verify());
}

TEST_F(EvidenceLedgerTest, ReopenedLedgerContinuesChain) {
    std::string head;
    {
        auto ledger = openFileLedger();
        appendScans(*ledger, 3);
        head = ledger->headHash();
    }

    auto reopened = openFileLedger();
    EXPECT_EQ(reopened->size(), 3u);
    EXPECT_EQ(reopened->headHash(), head);

    auto record = reopened->append(makeEvent("10.0.0.9", SecurityEventKind::PORT_SCAN, SeverityLevel::HIGH, 9));
    EXPECT_EQ(record.sequence, 4u);
    EXPECT_EQ(record.previous_hash, head);
    EXPECT_TRUE(reopened->verify(1, 4));
}

TEST_F(EvidenceLedgerTest, TamperedPayloadBreaksThatRangeAndLaterOnes) {
    {
        auto ledger = openFileLedger();
        appendScans(*ledger, 5);
    }

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 5u);
    auto record = nlohmann::json::parse(lines[2]);
    record["payload"]["distinct_ports"] = 99;
    lines[2] = record.dump();
    writeLines(lines);

    auto ledger = openFileLedger();
    EXPECT_TRUE(ledger->verify(1, 2));
    EXPECT_FALSE(ledger->isHalted());

    EXPECT_FALSE(ledger->verify(1, 3));
    EXPECT_FALSE(ledger->verify(3, 5));
    EXPECT_FALSE(ledger->verify(4, 5));
    EXPECT_TRUE(ledger->isHalted());

    auto result = ledger->verifyChain();
    EXPECT_FALSE(result.intact);
    EXPECT_EQ(result.first_broken_sequence, std::optional<uint64_t>(3));
    EXPECT_EQ(result.records_checked, 2u);
    EXPECT_EQ(result.reason, "record hash mismatch");
}

TEST_F(EvidenceLedgerTest, TamperedPreviousHashIsReported) {
    {
        auto ledger = openFileLedger();
        appendScans(*ledger, 5);
    }

    auto lines = readLines();
    auto record = nlohmann::json::parse(lines[3]);
    record["previous_hash"] = std::string(64, 'f');
    lines[3] = record.dump();
    writeLines(lines);

    auto ledger = openFileLedger();
    auto result = ledger->verifyChain();
    EXPECT_FALSE(result.intact);
    EXPECT_EQ(result.first_broken_sequence, std::optional<uint64_t>(4));
    EXPECT_THAT(result.reason, HasSubstr("previous hash"));

    EXPECT_THROW(ledger->append(makeEvent("10.0.0.5", SecurityEventKind::PORT_SCAN, SeverityLevel::HIGH, 9)),
                 LedgerHaltedError);
    // Committed records stay readable after a halt
    EXPECT_TRUE(ledger->query(EvidenceQuery()).next().has_value());
}

TEST_F(EvidenceLedgerTest, InterruptedWriteIsCutOffOnOpen) {
    {
        auto ledger = openFileLedger();
        appendScans(*ledger, 3);
    }
    {
        std::ofstream output(ledger_path_, std::ios::app);
        output << "{\"sequence\":4,\"timestamp\":17000";
    }

    auto storage = std::make_shared<FileLedgerStorage>(ledger_path_);
    EXPECT_EQ(storage->size(), 3u);
    EXPECT_GT(storage->recoveredBytes(), 0u);

    EvidenceLedger ledger(storage, EvidenceConfig());
    EXPECT_TRUE(ledger.verify());
    EXPECT_EQ(ledger.append(makeEvent("10.0.0.5", SecurityEventKind::PORT_SCAN, SeverityLevel::HIGH, 4)).sequence, 4u);
    EXPECT_TRUE(ledger.verify(1, 4));
    EXPECT_EQ(readLines().size(), 4u);
}

TEST_F(EvidenceLedgerTest, HmacKeyChangesHashesAndIsChecked) {
    {
        auto ledger = openFileLedger("first-key");
        appendScans(*ledger, 2);
        EXPECT_TRUE(ledger->verify());
    }

    EXPECT_TRUE(openFileLedger("first-key")->verify());
    EXPECT_FALSE(openFileLedger("second-key")->verify());
    EXPECT_FALSE(openFileLedger()->verify());
}

TEST_F(EvidenceLedgerTest, VerifyBeyondCommittedSizeFails) {
    auto ledger = openFileLedger();
    appendScans(*ledger, 2);
    EXPECT_FALSE(ledger->verify(1, 3));
    EXPECT_TRUE(ledger->verify(2, 1));
    EXPECT_FALSE(ledger->isHalted());
}

TEST(EvidenceQueryTest, FiltersAndRestartableCursor) {
    EvidenceLedger ledger(std::make_shared<MemoryLedgerStorage>(), EvidenceConfig());
    ledger.append(makeEvent("10.0.0.5", SecurityEventKind::PORT_SCAN, SeverityLevel::HIGH, 0));
    ledger.append(makeEvent("10.0.0.6", SecurityEventKind::UNAUTHORIZED_CONNECTION, SeverityLevel::MEDIUM, 1));
    ledger.append(makeEvent("10.0.0.5", SecurityEventKind::UNAUTHORIZED_CONNECTION, SeverityLevel::LOW, 2));
    ledger.append(makeEvent("10.0.0.5", SecurityEventKind::PORT_SCAN, SeverityLevel::CRITICAL, 3));

    EvidenceQuery by_source;
    by_source.source = SourceIdentity::network("10.0.0.5");
    auto cursor = ledger.query(by_source);

    std::vector<uint64_t> sequences;
    while (auto record = cursor.next()) {
        sequences.push_back(record->sequence);
    }
    EXPECT_THAT(sequences, ElementsAre(1, 3, 4));

    // Records appended after the query are outside its prefix
    ledger.append(makeEvent("10.0.0.5", SecurityEventKind::PORT_SCAN, SeverityLevel::HIGH, 4));
    cursor.rewind();
    sequences.clear();
    while (auto record = cursor.next()) {
        sequences.push_back(record->sequence);
    }
    EXPECT_THAT(sequences, ElementsAre(1, 3, 4));

    EvidenceQuery severe_scans;
    severe_scans.kind = SecurityEventKind::PORT_SCAN;
    severe_scans.min_severity = SeverityLevel::HIGH;
    severe_scans.from_sequence = 2;
    severe_scans.to_time = fromMillis(1700000003000);
    auto severe = ledger.query(severe_scans);
    auto record = severe.next();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->sequence, 4u);
    EXPECT_FALSE(severe.next().has_value());
}

TEST(EvidenceLedgerStorageTest, WriteFailureHaltsLedger) {
    auto storage = std::make_shared<NiceMock<MockLedgerStorage>>();
    ON_CALL(*storage, size()).WillByDefault(Return(0));
    EXPECT_CALL(*storage, append(_)).WillOnce(Throw(LedgerWriteError("disk full")));

    EvidenceLedger ledger(storage, EvidenceConfig());
    auto event = makeEvent("10.0.0.5", SecurityEventKind::PORT_SCAN, SeverityLevel::HIGH, 0);

    EXPECT_THROW(ledger.append(event), LedgerWriteError);
    EXPECT_TRUE(ledger.isHalted());
    EXPECT_EQ(ledger.haltReason(), "disk full");
    EXPECT_THROW(ledger.append(event), LedgerHaltedError);
    EXPECT_EQ(ledger.headHash(), RecordHasher::genesisHash());
}

TEST(EvidenceRecordTest, ExportSchema) {
    RecordHasher hasher;
    auto event = makeEvent("10.0.0.5", SecurityEventKind::PORT_SCAN, SeverityLevel::HIGH, 0);
    EvidenceRecord record{1, event, RecordHasher::genesisHash(), hasher.hash(1, event, RecordHasher::genesisHash())};

    auto json = record.toJson();
    for (const char* key : {"sequence", "timestamp", "kind", "source", "severity", "score",
                            "payload", "record_hash", "previous_hash"}) {
        EXPECT_TRUE(json.contains(key)) << key;
    }
    auto parsed = EvidenceRecord::fromJson(json);
    EXPECT_EQ(hasher.hash(parsed.sequence, parsed.event, parsed.previous_hash), record.record_hash);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
