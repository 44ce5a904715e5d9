#include "modules/detection/file_access_monitor.hpp"
#include <gtest/gtest.h>

using namespace sovereign_defense::detection;
using namespace sovereign_defense::event_management;
using sovereign_defense::config::DetectionConfig;
using sovereign_defense::config::defaultFileSensitivityRules;

class FileAccessMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.file_sensitivity_rules = defaultFileSensitivityRules();
        config_.file_dedup_window = std::chrono::seconds(1);
        monitor_ = std::make_unique<FileAccessMonitor>(config_);
    }

    static FileAccessEvent access(const std::string& path, FileAccessKind kind, int64_t millis = 0) {
        FileAccessEvent event;
        event.path = path;
        event.pid = 812;
        event.process_path = "/usr/bin/vim";
        event.access_kind = kind;
        event.timestamp = fromMillis(1700000000000 + millis);
        return event;
    }

    DetectionConfig config_;
    std::unique_ptr<FileAccessMonitor> monitor_;
};

TEST_F(FileAccessMonitorTest, ShadowWriteIsAtLeastHigh) {
    auto event = monitor_->observe(access("/etc/shadow", FileAccessKind::WRITE));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->getKind(), SecurityEventKind::SENSITIVE_FILE_ACCESS);
    EXPECT_GE(event->getSeverity(), SeverityLevel::HIGH);
    EXPECT_EQ(event->getSource().key(), "proc:/usr/bin/vim");
    EXPECT_EQ(event->getPayload()["rule"], "shadow");
    EXPECT_EQ(event->getPayload()["access_kind"], "write");
}

TEST_F(FileAccessMonitorTest, UnlistedPathProducesNothing) {
    EXPECT_FALSE(monitor_->observe(access("/tmp/scratch.txt", FileAccessKind::READ)).has_value());
    EXPECT_FALSE(monitor_->observe(access("/var/log/syslog", FileAccessKind::DELETE)).has_value());
}

TEST_F(FileAccessMonitorTest, SeverityIsMaxOfRuleAndAccessKind) {
    auto deleted = monitor_->observe(access("/etc/shadow", FileAccessKind::DELETE));
    ASSERT_TRUE(deleted.has_value());
    EXPECT_EQ(deleted->getSeverity(), SeverityLevel::CRITICAL);

    auto key_read = monitor_->observe(access("/home/alice/.ssh/id_ed25519", FileAccessKind::READ));
    ASSERT_TRUE(key_read.has_value());
    EXPECT_EQ(key_read->getSeverity(), SeverityLevel::MEDIUM);
    EXPECT_EQ(key_read->getPayload()["rule_match"], "glob");

    auto sudoers = monitor_->observe(access("/etc/sudoers.d/90-cloud", FileAccessKind::READ));
    ASSERT_TRUE(sudoers.has_value());
    EXPECT_EQ(sudoers->getSeverity(), SeverityLevel::HIGH);
}

TEST_F(FileAccessMonitorTest, RuleAccessKindsRestrictMatches) {
    // The passwd rule only covers modification
    EXPECT_FALSE(monitor_->observe(access("/etc/passwd", FileAccessKind::READ)).has_value());
    EXPECT_TRUE(monitor_->observe(access("/etc/passwd", FileAccessKind::WRITE)).has_value());
}

TEST_F(FileAccessMonitorTest, IdenticalHitsWithinDedupWindowAreSuppressed) {
    EXPECT_TRUE(monitor_->observe(access("/etc/shadow", FileAccessKind::READ, 0)).has_value());
    EXPECT_FALSE(monitor_->observe(access("/etc/shadow", FileAccessKind::READ, 500)).has_value());
    EXPECT_TRUE(monitor_->observe(access("/etc/shadow", FileAccessKind::WRITE, 600)).has_value());
    EXPECT_TRUE(monitor_->observe(access("/etc/shadow", FileAccessKind::READ, 1500)).has_value());
    EXPECT_EQ(monitor_->suppressedDuplicates(), 1u);
}

TEST_F(FileAccessMonitorTest, HighestSeverityRuleWins) {
    sovereign_defense::config::FileSensitivityRule broad;
    broad.name = "etc";
    broad.pattern = "/etc/";
    broad.match_type = sovereign_defense::config::RuleMatchType::PREFIX;
    broad.min_severity = SeverityLevel::LOW;
    config_.file_sensitivity_rules.push_back(broad);
    FileAccessMonitor monitor(config_);

    auto rule = monitor.matchRule(access("/etc/shadow", FileAccessKind::READ));
    ASSERT_TRUE(rule.has_value());
    EXPECT_EQ(rule->name, "shadow");
    EXPECT_EQ(monitor.matchRule(access("/etc/hosts", FileAccessKind::READ))->name, "etc");
}

TEST_F(FileAccessMonitorTest, PrefixMatchesWholePathComponents) {
    sovereign_defense::config::FileSensitivityRule keys;
    keys.name = "ssh_dir";
    keys.pattern = "/home/u/.ssh";
    keys.match_type = sovereign_defense::config::RuleMatchType::PREFIX;
    keys.min_severity = SeverityLevel::MEDIUM;
    config_.file_sensitivity_rules = {keys};
    FileAccessMonitor monitor(config_);

    EXPECT_TRUE(monitor.matchRule(access("/home/u/.ssh", FileAccessKind::READ)).has_value());
    EXPECT_TRUE(monitor.matchRule(access("/home/u/.ssh/id_ed25519", FileAccessKind::READ)).has_value());
    EXPECT_FALSE(monitor.matchRule(access("/home/u/.ssh_old", FileAccessKind::READ)).has_value());
    EXPECT_FALSE(monitor.matchRule(access("/home/u/.sshrc", FileAccessKind::READ)).has_value());
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
