#include "modules/monitoring/json_feed_source.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>

using namespace testing;
using namespace sovereign_defense::monitoring;
using namespace sovereign_defense::event_management;

class JsonFeedSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "sovereign_defense_feed_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        feed_path_ = (test_dir_ / "observations.jsonl").string();

        sink_ = [this](const Observation& observation) {
            sources_.push_back(observationSource(observation).key());
            return true;
        };
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    void append(const std::string& text) {
        std::ofstream output(feed_path_, std::ios::app | std::ios::binary);
        output << text;
    }

    static std::string connection(const std::string& address, int port) {
        return R"({"type": "network", "source": ")" + address +
               R"(", "destination_address": "192.168.1.10", "destination_port": )" + std::to_string(port) +
               R"(, "protocol": "tcp", "timestamp": 1000})";
    }

    std::filesystem::path test_dir_;
    std::string feed_path_;
    std::vector<std::string> sources_;
    ObservationSink sink_;
};

TEST_F(JsonFeedSourceTest, ReadsCompleteLinesOnly) {
    append(connection("10.0.0.5", 22) + "\n" + connection("10.0.0.6", 80).substr(0, 20));

    JsonFeedSource source(feed_path_);
    EXPECT_EQ(source.poll(sink_), 1u);
    EXPECT_THAT(sources_, ElementsAre("net:10.0.0.5"));

    // The writer finishes the line
    append(connection("10.0.0.6", 80).substr(20) + "\n");
    EXPECT_EQ(source.poll(sink_), 1u);
    EXPECT_THAT(sources_, ElementsAre("net:10.0.0.5", "net:10.0.0.6"));
    EXPECT_EQ(source.poll(sink_), 0u);
}

TEST_F(JsonFeedSourceTest, MalformedLinesAreCountedAndSkipped) {
    append("not json\n\n" + connection("10.0.0.5", 22) + "\n" + R"({"type": "telepathy"})" + "\n");

    JsonFeedSource source(feed_path_);
    EXPECT_EQ(source.poll(sink_), 1u);
    EXPECT_EQ(source.malformedLines(), 2u);
    EXPECT_EQ(source.linesRead(), 3u);
}

TEST_F(JsonFeedSourceTest, OutOfRangePortIsMalformed) {
    append(connection("10.0.0.5", 65558) + "\n" + connection("10.0.0.6", 443) + "\n");

    JsonFeedSource source(feed_path_);
    EXPECT_EQ(source.poll(sink_), 1u);
    EXPECT_EQ(source.malformedLines(), 1u);
    EXPECT_THAT(sources_, ElementsAre("net:10.0.0.6"));
}

TEST_F(JsonFeedSourceTest, ShrunkFileIsReadFromStart) {
    append(connection("10.0.0.5", 22) + "\n" + connection("10.0.0.6", 22) + "\n");
    JsonFeedSource source(feed_path_);
    EXPECT_EQ(source.poll(sink_), 2u);

    std::filesystem::remove(feed_path_);
    append(connection("10.0.0.7", 22) + "\n");
    EXPECT_EQ(source.poll(sink_), 1u);
    EXPECT_EQ(sources_.back(), "net:10.0.0.7");
}

TEST_F(JsonFeedSourceTest, StartAtEndSkipsBacklog) {
    append(connection("10.0.0.5", 22) + "\n");
    JsonFeedSource source(feed_path_, std::chrono::milliseconds(10), true);
    EXPECT_EQ(source.poll(sink_), 0u);

    append(connection("10.0.0.6", 22) + "\n");
    EXPECT_EQ(source.poll(sink_), 1u);
    EXPECT_THAT(sources_, ElementsAre("net:10.0.0.6"));
}

TEST_F(JsonFeedSourceTest, MissingFileIsRetried) {
    JsonFeedSource source(feed_path_);
    EXPECT_EQ(source.poll(sink_), 0u);

    append(connection("10.0.0.5", 22) + "\n");
    EXPECT_EQ(source.poll(sink_), 1u);
    EXPECT_THROW(JsonFeedSource(""), std::invalid_argument);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
