#pragma once

#include "modules/logging/logging_module.hpp"
#include "modules/monitoring/capture_source.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sovereign_defense {
namespace monitoring {

/**
 * @brief Tails a JSON-lines file written by an external capture tool
 *
 * One observation per line, in the format accepted by observationFromJson.
 * Reading resumes from the last consumed offset; an incomplete last line is
 * left for the next poll. If the file shrinks (rotation or truncation) it is
 * read again from the start. A missing file is retried on every poll.
 */
class JsonFeedSource : public CaptureSource {
public:
    JsonFeedSource(const std::string& path,
                   std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500),
                   bool start_at_end = false,
                   std::shared_ptr<logging::LoggingModule> logging_module = nullptr);
    ~JsonFeedSource() override;

    std::string name() const override { return "json_feed:" + path_; }
    void start(ObservationSink sink) override;
    void stop() override;

    /**
     * @brief Reads every complete line appended since the last poll
     *
     * @return Number of observations handed to the sink
     */
    size_t poll(const ObservationSink& sink);

    const std::string& getPath() const { return path_; }
    std::streamoff getPosition() const { return position_; }
    uint64_t linesRead() const { return lines_read_; }
    uint64_t malformedLines() const { return malformed_lines_; }

private:
    void pollLoop(ObservationSink sink);

    std::string path_;
    std::chrono::milliseconds poll_interval_;
    bool start_at_end_;
    std::shared_ptr<logging::LoggingModule> logging_module_;

    std::streamoff position_ = 0;
    bool positioned_ = false;
    bool missing_reported_ = false;

    std::atomic<uint64_t> lines_read_{0};
    std::atomic<uint64_t> malformed_lines_{0};

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    bool stopping_ = false;
    std::unique_ptr<std::thread> thread_;
};

} // namespace monitoring
} // namespace sovereign_defense
