#include "modules/detection/scan_window_tracker.hpp"
#include <gtest/gtest.h>

using namespace sovereign_defense::detection;
using namespace sovereign_defense::event_management;

class ScanWindowTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.scan_window = std::chrono::seconds(60);
        config_.scan_port_threshold = 3;
        tracker_ = std::make_unique<ScanWindowTracker>(config_);
    }

    static NetworkEvent connectionAttempt(const std::string& address, uint16_t port, int seconds) {
        NetworkEvent event;
        event.source = SourceIdentity::network(address);
        event.destination_address = "192.168.1.10";
        event.destination_port = port;
        event.timestamp = fromMillis(1700000000000 + seconds * 1000LL);
        return event;
    }

    sovereign_defense::config::DetectionConfig config_;
    std::unique_ptr<ScanWindowTracker> tracker_;
};

TEST_F(ScanWindowTrackerTest, ThresholdWithinWindowEmitsOnce) {
    EXPECT_FALSE(tracker_->observe(connectionAttempt("10.0.0.5", 22, 0)).has_value());
    EXPECT_FALSE(tracker_->observe(connectionAttempt("10.0.0.5", 80, 5)).has_value());

    auto event = tracker_->observe(connectionAttempt("10.0.0.5", 443, 10));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->getKind(), SecurityEventKind::PORT_SCAN);
    EXPECT_EQ(event->getSource().key(), "net:10.0.0.5");
    EXPECT_EQ(event->getPayload()["distinct_ports"], 3);
    EXPECT_EQ(event->getPayload()["ports"], nlohmann::json::array({22, 80, 443}));

    // Further ports inside the cooldown stay quiet
    EXPECT_FALSE(tracker_->observe(connectionAttempt("10.0.0.5", 8080, 20)).has_value());
    EXPECT_FALSE(tracker_->observe(connectionAttempt("10.0.0.5", 3306, 30)).has_value());
}

TEST_F(ScanWindowTrackerTest, RepeatedPortsDoNotCount) {
    for (int i = 0; i < 10; ++i) {
        EXPECT_FALSE(tracker_->observe(connectionAttempt("10.0.0.5", 22, i)).has_value());
    }
    EXPECT_FALSE(tracker_->observe(connectionAttempt("10.0.0.5", 80, 11)).has_value());
}

TEST_F(ScanWindowTrackerTest, PortsOutsideWindowAreEvicted) {
    EXPECT_FALSE(tracker_->observe(connectionAttempt("10.0.0.5", 22, 0)).has_value());
    EXPECT_FALSE(tracker_->observe(connectionAttempt("10.0.0.5", 80, 30)).has_value());
    // Port 22 left the window at t=60
    EXPECT_FALSE(tracker_->observe(connectionAttempt("10.0.0.5", 443, 61)).has_value());
    EXPECT_TRUE(tracker_->observe(connectionAttempt("10.0.0.5", 8443, 62)).has_value());
}

TEST_F(ScanWindowTrackerTest, EmitsAgainAfterCooldown) {
    tracker_->observe(connectionAttempt("10.0.0.5", 22, 0));
    tracker_->observe(connectionAttempt("10.0.0.5", 80, 5));
    ASSERT_TRUE(tracker_->observe(connectionAttempt("10.0.0.5", 443, 10)).has_value());

    EXPECT_FALSE(tracker_->observe(connectionAttempt("10.0.0.5", 1000, 75)).has_value());
    EXPECT_FALSE(tracker_->observe(connectionAttempt("10.0.0.5", 1001, 76)).has_value());
    EXPECT_TRUE(tracker_->observe(connectionAttempt("10.0.0.5", 1002, 77)).has_value());
}

TEST_F(ScanWindowTrackerTest, SourcesAreTrackedIndependently) {
    tracker_->observe(connectionAttempt("10.0.0.5", 22, 0));
    tracker_->observe(connectionAttempt("10.0.0.6", 80, 1));
    tracker_->observe(connectionAttempt("10.0.0.7", 443, 2));

    EXPECT_EQ(tracker_->trackedSources(), 3u);
    EXPECT_FALSE(tracker_->observe(connectionAttempt("10.0.0.5", 80, 3)).has_value());
}

TEST_F(ScanWindowTrackerTest, OutOfOrderEventOlderThanWindowIsDropped) {
    tracker_->observe(connectionAttempt("10.0.0.5", 22, 100));
    EXPECT_FALSE(tracker_->observe(connectionAttempt("10.0.0.5", 80, 30)).has_value());
    EXPECT_EQ(tracker_->droppedStaleEvents(), 1u);
}

TEST_F(ScanWindowTrackerTest, SweepWaitsForIdleWindowAndCooldown) {
    tracker_->observe(connectionAttempt("10.0.0.5", 22, 0));
    tracker_->observe(connectionAttempt("10.0.0.5", 80, 5));
    tracker_->observe(connectionAttempt("10.0.0.5", 443, 10));
    tracker_->observe(connectionAttempt("10.0.0.9", 22, 0));

    EXPECT_EQ(tracker_->sweep(connectionAttempt("", 0, 60).timestamp), 1u);
    EXPECT_EQ(tracker_->sweep(connectionAttempt("", 0, 69).timestamp), 0u);
    EXPECT_EQ(tracker_->sweep(connectionAttempt("", 0, 70).timestamp), 1u);
    EXPECT_EQ(tracker_->trackedSources(), 0u);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
