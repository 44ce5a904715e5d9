#include "modules/decision/decision_engine.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <thread>

using namespace testing;
using namespace sovereign_defense::decision;
using namespace sovereign_defense::event_management;
using sovereign_defense::evidence::EvidenceRecord;

class DecisionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.block_base_duration = std::chrono::seconds(300);
        config_.block_escalation_cap = std::chrono::seconds(86400);
        config_.block_violation_threshold = 3;
        config_.violation_accounting_window = std::chrono::seconds(3600);
        config_.recidivism_retention_period = std::chrono::seconds(604800);
        engine_ = std::make_unique<DecisionEngine>(config_);
    }

    static TimePoint at(int64_t seconds) {
        return fromMillis(1700000000000 + seconds * 1000);
    }

    EvidenceRecord violation(const std::string& address, int64_t seconds) {
        SecurityEvent event(SecurityEventKind::PORT_SCAN,
                            SourceIdentity::network(address),
                            SeverityLevel::HIGH,
                            0.8,
                            nlohmann::json{{"distinct_ports", 20}},
                            at(seconds));
        return EvidenceRecord{++sequence_, event, "", ""};
    }

    std::vector<EnforcementAction> offend(const std::string& address, std::initializer_list<int64_t> times) {
        std::vector<EnforcementAction> actions;
        for (auto seconds : times) {
            auto result = engine_->onEvidence(violation(address, seconds));
            actions.insert(actions.end(), result.begin(), result.end());
        }
        return actions;
    }

    sovereign_defense::config::DecisionConfig config_;
    std::unique_ptr<DecisionEngine> engine_;
    uint64_t sequence_ = 0;
};

TEST_F(DecisionEngineTest, ThirdViolationBlocksForBaseDuration) {
    EXPECT_TRUE(offend("10.0.0.5", {0, 10}).empty());
    EXPECT_EQ(engine_->snapshot(SourceIdentity::network("10.0.0.5"))->lifecycle, ThreatLifecycle::WATCHED);

    auto actions = offend("10.0.0.5", {20});
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].type, EnforcementActionType::BLOCK);
    ASSERT_TRUE(actions[0].rule.has_value());
    EXPECT_EQ(actions[0].rule->duration, std::chrono::seconds(300));
    EXPECT_EQ(actions[0].rule->expires_at, std::optional<TimePoint>(at(320)));
    EXPECT_EQ(actions[0].rule->first_evidence_sequence, 1u);
    EXPECT_EQ(actions[0].rule->last_evidence_sequence, 3u);

    auto state = engine_->snapshot(SourceIdentity::network("10.0.0.5"));
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->lifecycle, ThreatLifecycle::BLOCKED);
    EXPECT_EQ(state->prior_block_count, 1u);
    EXPECT_EQ(engine_->pendingExpiries(), 1u);
}

TEST_F(DecisionEngineTest, ViolationsOutsideAccountingWindowDoNotBlock) {
    EXPECT_TRUE(offend("10.0.0.5", {0, 1800, 3700}).empty());
    EXPECT_EQ(offend("10.0.0.5", {3800}).size(), 1u);
}

TEST_F(DecisionEngineTest, BlockExpiresOnSweep) {
    offend("10.0.0.5", {0, 10, 20});

    EXPECT_TRUE(engine_->sweep(at(319)).empty());
    auto actions = engine_->sweep(at(320));
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].type, EnforcementActionType::UNBLOCK);
    EXPECT_EQ(actions[0].source, SourceIdentity::network("10.0.0.5"));
    EXPECT_EQ(engine_->snapshot(SourceIdentity::network("10.0.0.5"))->lifecycle, ThreatLifecycle::EXPIRED);
    EXPECT_TRUE(engine_->sweep(at(1000)).empty());
}

TEST_F(DecisionEngineTest, ReoffenderGetsDoubledDuration) {
    offend("10.0.0.5", {0, 10, 20});
    engine_->sweep(at(320));

    auto actions = offend("10.0.0.5", {400});
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].type, EnforcementActionType::BLOCK);
    EXPECT_EQ(actions[0].rule->duration, std::chrono::seconds(600));

    engine_->sweep(at(1000));
    actions = offend("10.0.0.5", {1100});
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].rule->duration, std::chrono::seconds(1200));
}

TEST_F(DecisionEngineTest, OverdueBlockExpiresBeforeNewViolation) {
    offend("10.0.0.5", {0, 10, 20});

    // No sweep ran; the late violation expires the block first, then re-blocks
    auto actions = offend("10.0.0.5", {500});
    ASSERT_EQ(actions.size(), 2u);
    EXPECT_EQ(actions[0].type, EnforcementActionType::UNBLOCK);
    EXPECT_EQ(actions[1].type, EnforcementActionType::BLOCK);
    EXPECT_EQ(actions[1].rule->duration, std::chrono::seconds(600));
}

TEST_F(DecisionEngineTest, ViolationDuringBlockExtendsIt) {
    offend("10.0.0.5", {0, 10, 20});
    EXPECT_TRUE(offend("10.0.0.5", {100}).empty());

    EXPECT_EQ(engine_->snapshot(SourceIdentity::network("10.0.0.5"))->block_expiry,
              std::optional<TimePoint>(at(400)));
    EXPECT_TRUE(engine_->sweep(at(320)).empty());
    EXPECT_TRUE(engine_->sweep(at(399)).empty());
    EXPECT_EQ(engine_->sweep(at(400)).size(), 1u);
}

TEST_F(DecisionEngineTest, ConcurrentViolationsProduceSingleBlock) {
    const int thread_count = 8;
    std::atomic<int> blocks{0};
    std::vector<EvidenceRecord> records;
    for (int i = 0; i < thread_count * 4; ++i) {
        records.push_back(violation("10.0.0.5", 10));
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 4; ++i) {
                for (const auto& action : engine_->onEvidence(records[static_cast<size_t>(t * 4 + i)])) {
                    if (action.type == EnforcementActionType::BLOCK) {
                        ++blocks;
                    }
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(blocks.load(), 1);
    auto state = engine_->snapshot(SourceIdentity::network("10.0.0.5"));
    EXPECT_EQ(state->violation_count, static_cast<uint64_t>(thread_count * 4));
    EXPECT_EQ(state->prior_block_count, 1u);
}

TEST_F(DecisionEngineTest, ReleaseWithoutBlockIsNoOp) {
    EXPECT_FALSE(engine_->release(SourceIdentity::network("10.0.0.5"), at(0)).has_value());

    offend("10.0.0.5", {0});
    EXPECT_FALSE(engine_->release(SourceIdentity::network("10.0.0.5"), at(1)).has_value());
    EXPECT_EQ(engine_->snapshot(SourceIdentity::network("10.0.0.5"))->lifecycle, ThreatLifecycle::WATCHED);
}

TEST_F(DecisionEngineTest, ReleaseEndsBlockAndCancelsExpiry) {
    offend("10.0.0.5", {0, 10, 20});

    auto action = engine_->release(SourceIdentity::network("10.0.0.5"), at(30));
    ASSERT_TRUE(action.has_value());
    EXPECT_EQ(action->type, EnforcementActionType::UNBLOCK);
    EXPECT_EQ(action->reason, "released by operator");

    // The stale schedule entry is ignored
    EXPECT_TRUE(engine_->sweep(at(320)).empty());
}

TEST_F(DecisionEngineTest, PermanentBlockAfterRepeatedBlocks) {
    config_.permanent_block_after = 1;
    engine_ = std::make_unique<DecisionEngine>(config_);

    auto first = offend("10.0.0.5", {0, 10, 20});
    ASSERT_EQ(first.size(), 1u);
    EXPECT_FALSE(first[0].rule->isPermanent());
    engine_->sweep(at(320));

    auto second = offend("10.0.0.5", {400});
    ASSERT_EQ(second.size(), 1u);
    EXPECT_TRUE(second[0].rule->isPermanent());
    EXPECT_FALSE(second[0].rule->expires_at.has_value());
    EXPECT_TRUE(engine_->sweep(at(86400 * 30)).empty());
    EXPECT_EQ(engine_->snapshot(SourceIdentity::network("10.0.0.5"))->lifecycle, ThreatLifecycle::BLOCKED);
}

TEST_F(DecisionEngineTest, BlockDurationIsCapped) {
    EXPECT_EQ(engine_->blockDuration(0), std::chrono::seconds(300));
    EXPECT_EQ(engine_->blockDuration(3), std::chrono::seconds(2400));
    EXPECT_EQ(engine_->blockDuration(9), std::chrono::seconds(86400));
    EXPECT_EQ(engine_->blockDuration(60), std::chrono::seconds(86400));
}

TEST_F(DecisionEngineTest, IdleSourcesEvictedAfterRetention) {
    offend("10.0.0.5", {0});
    offend("10.0.0.6", {1000});
    EXPECT_EQ(engine_->trackedSources(), 2u);

    engine_->sweep(at(604799));
    EXPECT_EQ(engine_->trackedSources(), 2u);
    engine_->sweep(at(604800));
    EXPECT_EQ(engine_->trackedSources(), 1u);
    EXPECT_FALSE(engine_->snapshot(SourceIdentity::network("10.0.0.5")).has_value());
}

TEST(ThreatStateTest, ActionJsonCarriesRule) {
    BlockRule rule;
    rule.scope = SourceIdentity::network("10.0.0.5");
    rule.duration = std::chrono::seconds(300);
    rule.expires_at = fromMillis(300000);
    rule.reason = "3 violations within 3600s";

    EnforcementAction action;
    action.source = rule.scope;
    action.rule = rule;
    action.reason = rule.reason;

    auto json = action.toJson();
    EXPECT_EQ(json["type"], "block");
    EXPECT_EQ(json["rule"]["duration_seconds"], 300);
    EXPECT_EQ(lifecycleToString(ThreatLifecycle::EXPIRED), "expired");
}

TEST_F(DecisionEngineTest, ReplayRebuildsStateAndResumesEnforcement) {
    // 10.0.0.5: block long elapsed; 10.0.0.6: block still running at t=400
    for (auto seconds : {0, 10, 20}) {
        engine_->replay(violation("10.0.0.5", seconds));
    }
    for (auto seconds : {200, 210, 220}) {
        engine_->replay(violation("10.0.0.6", seconds));
    }
    EXPECT_EQ(engine_->snapshot(SourceIdentity::network("10.0.0.5"))->lifecycle, ThreatLifecycle::BLOCKED);

    auto actions = engine_->resumeEnforcement(at(400));
    ASSERT_EQ(actions.size(), 3u);
    EXPECT_EQ(actions[0].type, EnforcementActionType::BLOCK);
    EXPECT_EQ(actions[1].type, EnforcementActionType::BLOCK);
    EXPECT_EQ(actions[2].type, EnforcementActionType::UNBLOCK);
    EXPECT_EQ(actions[2].source, SourceIdentity::network("10.0.0.5"));

    auto elapsed = engine_->snapshot(SourceIdentity::network("10.0.0.5"));
    EXPECT_EQ(elapsed->lifecycle, ThreatLifecycle::EXPIRED);
    EXPECT_EQ(elapsed->prior_block_count, 1u);
    EXPECT_EQ(engine_->snapshot(SourceIdentity::network("10.0.0.6"))->lifecycle, ThreatLifecycle::BLOCKED);

    // Recidivism memory survived the replay
    auto next = offend("10.0.0.5", {1000, 1010, 1020});
    ASSERT_EQ(next.size(), 1u);
    EXPECT_EQ(next[0].rule->duration, std::chrono::seconds(600));
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
