#include "modules/pipeline/defense_pipeline.hpp"
#include "modules/evidence/ledger_error.hpp"
#include "modules/evidence/ledger_storage.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <mutex>
#include <thread>

using namespace testing;
using namespace sovereign_defense;
using namespace sovereign_defense::event_management;
using sovereign_defense::pipeline::DefensePipeline;
using sovereign_defense::pipeline::PipelineHealth;

class MockEnforcementGateway : public response::EnforcementGateway {
public:
    MOCK_METHOD(bool, block, (const SourceIdentity& source, std::chrono::seconds duration), (override));
    MOCK_METHOD(bool, unblock, (const SourceIdentity& source), (override));
};

class MockLedgerStorage : public evidence::LedgerStorage {
public:
    MOCK_METHOD(void, append, (const evidence::EvidenceRecord& record), (override));
    MOCK_METHOD(void, flush, (), (override));
    MOCK_METHOD(uint64_t, size, (), (const, override));
    MOCK_METHOD(std::unique_ptr<evidence::RecordReader>, openReader, (uint64_t first, uint64_t last), (const, override));
};

// Collects alert titles for inspection
class RecordingAlertSink : public alerting::AlertSink {
public:
    std::string name() const override { return "recording"; }

    bool notify(const alerting::AlertRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        titles_.push_back(request.title);
        return true;
    }

    std::vector<std::string> titles() {
        std::lock_guard<std::mutex> lock(mutex_);
        return titles_;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> titles_;
};

class DefensePipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.detection.scan_port_threshold = 3;
        config_.detection.connection_allow_list = {"10.0.0.0/8"};
        config_.decision.block_violation_threshold = 1;
        config_.evidence.storage = "memory";
        config_.enforcement.initial_backoff = std::chrono::milliseconds(1);
        config_.enforcement.max_backoff = std::chrono::milliseconds(2);
        config_.pipeline.worker_count = 2;
        // Keep the background sweep from expiring blocks during a test
        config_.pipeline.sweep_interval = std::chrono::milliseconds(3600000);

        gateway_ = std::make_shared<StrictMock<MockEnforcementGateway>>();
        alert_sink_ = std::make_shared<RecordingAlertSink>();
    }

    std::unique_ptr<DefensePipeline> makePipeline(std::shared_ptr<evidence::LedgerStorage> storage =
                                                      std::make_shared<evidence::MemoryLedgerStorage>()) {
        ledger_ = std::make_shared<evidence::EvidenceLedger>(std::move(storage), config_.evidence);
        auto pipeline = std::make_unique<DefensePipeline>(config_, ledger_, gateway_);
        pipeline->addAlertSink(alert_sink_);
        return pipeline;
    }

    static NetworkEvent connectionAttempt(const std::string& address, uint16_t port, int64_t seconds,
                              int64_t base_millis = 1700000000000) {
        NetworkEvent event;
        event.source = SourceIdentity::network(address, 40000);
        event.destination_address = "192.168.1.10";
        event.destination_port = port;
        event.timestamp = fromMillis(base_millis + seconds * 1000);
        return event;
    }

    void scan(DefensePipeline& pipeline, const std::string& address, int64_t base_millis = 1700000000000) {
        ASSERT_TRUE(pipeline.submit(connectionAttempt(address, 22, 0, base_millis)));
        ASSERT_TRUE(pipeline.submit(connectionAttempt(address, 80, 5, base_millis)));
        ASSERT_TRUE(pipeline.submit(connectionAttempt(address, 443, 10, base_millis)));
    }

    static int64_t minutesAgo(int64_t minutes) {
        return toMillis(Clock::now()) - minutes * 60 * 1000;
    }

    template <typename Predicate>
    static bool waitUntil(Predicate predicate) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!predicate()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }

    config::DefenseConfig config_;
    std::shared_ptr<StrictMock<MockEnforcementGateway>> gateway_;
    std::shared_ptr<RecordingAlertSink> alert_sink_;
    std::shared_ptr<evidence::EvidenceLedger> ledger_;
};

TEST_F(DefensePipelineTest, ScanIsRecordedThenBlocked) {
    EXPECT_CALL(*gateway_, block(SourceIdentity::network("10.0.0.5"), std::chrono::seconds(300)))
        .WillOnce(Return(true));

    auto pipeline = makePipeline();
    pipeline->start();
    scan(*pipeline, "10.0.0.5");
    pipeline->stop();

    ASSERT_EQ(ledger_->size(), 1u);
    auto record = ledger_->query(evidence::EvidenceQuery()).next();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->event.getKind(), SecurityEventKind::PORT_SCAN);
    EXPECT_TRUE(ledger_->verify());

    auto state = pipeline->decisionEngine().snapshot(SourceIdentity::network("10.0.0.5"));
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->lifecycle, decision::ThreatLifecycle::BLOCKED);
    EXPECT_EQ(state->last_evidence_sequence, 1u);
    EXPECT_TRUE(pipeline->enforcementDispatcher().isEnforced(SourceIdentity::network("10.0.0.5")));
    EXPECT_THAT(alert_sink_->titles(), Contains("port_scan"));
    EXPECT_THAT(alert_sink_->titles(), Contains("block"));

    auto status = pipeline->status();
    EXPECT_EQ(status.health, PipelineHealth::HEALTHY);
    EXPECT_EQ(status.observations_accepted, 3u);
    EXPECT_EQ(status.records_committed, 1u);
    EXPECT_EQ(status.enforcement_completed, 1u);
    EXPECT_EQ(status.toJson()["evidence"]["ledger_size"], 1);
}

TEST_F(DefensePipelineTest, InvalidObservationsAreRejected) {
    auto pipeline = makePipeline();
    EXPECT_FALSE(pipeline->submit(connectionAttempt("10.0.0.5", 22, 0)));

    pipeline->start();
    EXPECT_FALSE(pipeline->submit(connectionAttempt("", 22, 0)));
    EXPECT_FALSE(pipeline->submit(connectionAttempt("10.0.0.5", 0, 0)));
    pipeline->stop();

    EXPECT_EQ(pipeline->status().observations_rejected, 2u);
    EXPECT_EQ(pipeline->status().observations_accepted, 0u);
    EXPECT_FALSE(pipeline->submit(connectionAttempt("10.0.0.5", 22, 0)));
}

TEST_F(DefensePipelineTest, OperatorReleaseUnblocks) {
    auto source = SourceIdentity::network("10.0.0.5");
    {
        InSequence sequence;
        EXPECT_CALL(*gateway_, block(source, _)).WillOnce(Return(true));
        EXPECT_CALL(*gateway_, unblock(source)).WillOnce(Return(true));
    }

    auto pipeline = makePipeline();
    pipeline->start();
    scan(*pipeline, "10.0.0.5");
    ASSERT_TRUE(waitUntil([&]() {
        auto state = pipeline->decisionEngine().snapshot(source);
        return state && state->lifecycle == decision::ThreatLifecycle::BLOCKED;
    }));

    auto action = pipeline->release(source);
    ASSERT_TRUE(action.has_value());
    EXPECT_EQ(action->type, decision::EnforcementActionType::UNBLOCK);
    EXPECT_FALSE(pipeline->release(source).has_value());
    pipeline->stop();

    EXPECT_FALSE(pipeline->enforcementDispatcher().isEnforced(source));
}

TEST_F(DefensePipelineTest, LedgerWriteFailureHaltsIngestion) {
    auto storage = std::make_shared<NiceMock<MockLedgerStorage>>();
    ON_CALL(*storage, size()).WillByDefault(Return(0));
    EXPECT_CALL(*storage, append(_)).WillOnce(Throw(evidence::LedgerWriteError("disk full")));

    auto pipeline = makePipeline(storage);
    pipeline->start();
    scan(*pipeline, "10.0.0.5");
    ASSERT_TRUE(waitUntil([&]() { return pipeline->isHalted(); }));

    // No decision without committed evidence
    EXPECT_FALSE(pipeline->submit(connectionAttempt("10.0.0.6", 22, 20)));
    pipeline->stop();

    auto status = pipeline->status();
    EXPECT_EQ(status.health, PipelineHealth::HALTED);
    EXPECT_EQ(status.halt_reason, "disk full");
    EXPECT_EQ(status.records_committed, 0u);
    EXPECT_FALSE(pipeline->decisionEngine().snapshot(SourceIdentity::network("10.0.0.5")).has_value());
    EXPECT_THAT(alert_sink_->titles(), Contains("ledger_halted"));
    EXPECT_EQ(status.toJson()["health"], "halted");
}

TEST_F(DefensePipelineTest, HaltedLedgerRefusesToStartIngestion) {
    auto pipeline = makePipeline();
    ledger_->halt("record hash mismatch");

    pipeline->start();
    EXPECT_TRUE(pipeline->isHalted());
    EXPECT_FALSE(pipeline->submit(connectionAttempt("10.0.0.5", 22, 0)));
    pipeline->stop();

    EXPECT_EQ(pipeline->status().halt_reason, "record hash mismatch");
}

class DefensePipelineRestartTest : public DefensePipelineTest {
protected:
    void SetUp() override {
        DefensePipelineTest::SetUp();
        ledger_path_ = (std::filesystem::temp_directory_path() / "sovereign_defense_restart_test.ledger").string();
        std::filesystem::remove(ledger_path_);
    }

    void TearDown() override {
        ledger_.reset();
        std::filesystem::remove(ledger_path_);
    }

    std::unique_ptr<DefensePipeline> reopen() {
        ledger_.reset();
        return makePipeline(std::make_shared<evidence::FileLedgerStorage>(ledger_path_));
    }

    std::string ledger_path_;
};

TEST_F(DefensePipelineRestartTest, ReoffenderAfterRestartGetsEscalatedBlock) {
    auto source = SourceIdentity::network("10.0.0.5");
    {
        InSequence sequence;
        EXPECT_CALL(*gateway_, block(source, std::chrono::seconds(300))).WillOnce(Return(true));
        // Restart: the elapsed block is re-applied, then lifted
        EXPECT_CALL(*gateway_, block(source, std::chrono::seconds(300))).WillOnce(Return(true));
        EXPECT_CALL(*gateway_, unblock(source)).WillOnce(Return(true));
        EXPECT_CALL(*gateway_, block(source, std::chrono::seconds(600))).WillOnce(Return(true));
    }

    {
        auto first_run = reopen();
        first_run->start();
        scan(*first_run, "10.0.0.5", minutesAgo(120));
        first_run->stop();
    }

    auto pipeline = reopen();
    pipeline->start();
    ASSERT_TRUE(waitUntil([&]() { return pipeline->status().enforcement_completed >= 2; }));

    auto restored = pipeline->decisionEngine().snapshot(source);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->lifecycle, decision::ThreatLifecycle::EXPIRED);
    EXPECT_EQ(restored->prior_block_count, 1u);
    EXPECT_FALSE(pipeline->enforcementDispatcher().isEnforced(source));

    scan(*pipeline, "10.0.0.5", minutesAgo(1));
    pipeline->stop();

    auto state = pipeline->decisionEngine().snapshot(source);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->lifecycle, decision::ThreatLifecycle::BLOCKED);
    ASSERT_TRUE(state->active_block.has_value());
    EXPECT_EQ(state->active_block->duration, std::chrono::seconds(600));
    EXPECT_EQ(ledger_->size(), 2u);
}

TEST_F(DefensePipelineRestartTest, ActiveBlockIsReappliedAfterRestart) {
    auto source = SourceIdentity::network("10.0.0.5");
    EXPECT_CALL(*gateway_, block(source, std::chrono::seconds(300))).Times(2).WillRepeatedly(Return(true));

    {
        auto first_run = reopen();
        first_run->start();
        scan(*first_run, "10.0.0.5", minutesAgo(2));
        first_run->stop();
    }

    auto pipeline = reopen();
    pipeline->start();
    ASSERT_TRUE(waitUntil([&]() { return pipeline->enforcementDispatcher().isEnforced(source); }));
    pipeline->stop();

    auto state = pipeline->decisionEngine().snapshot(source);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->lifecycle, decision::ThreatLifecycle::BLOCKED);
    EXPECT_EQ(state->last_evidence_sequence, 1u);
}

TEST_F(DefensePipelineRestartTest, RecordsPastRetentionAreNotReplayed) {
    config_.decision.recidivism_retention_period = std::chrono::seconds(3600);
    EXPECT_CALL(*gateway_, block(SourceIdentity::network("10.0.0.5"), _)).WillOnce(Return(true));

    {
        auto first_run = reopen();
        first_run->start();
        scan(*first_run, "10.0.0.5", minutesAgo(180));
        first_run->stop();
    }

    auto pipeline = reopen();
    pipeline->start();
    pipeline->stop();

    EXPECT_FALSE(pipeline->decisionEngine().snapshot(SourceIdentity::network("10.0.0.5")).has_value());
}

TEST_F(DefensePipelineTest, NullLedgerThrows) {
    EXPECT_THROW(DefensePipeline(config_, nullptr, gateway_), std::invalid_argument);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
