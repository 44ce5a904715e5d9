#include "modules/monitoring/json_feed_source.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace sovereign_defense {
namespace monitoring {

using logging::LogLevel;

JsonFeedSource::JsonFeedSource(const std::string& path,
                               std::chrono::milliseconds poll_interval,
                               bool start_at_end,
                               std::shared_ptr<logging::LoggingModule> logging_module)
    : path_(path)
    , poll_interval_(poll_interval)
    , start_at_end_(start_at_end)
    , logging_module_(std::move(logging_module)) {
    if (path_.empty()) {
        throw std::invalid_argument("JSON feed source requires a path");
    }
}

JsonFeedSource::~JsonFeedSource() {
    stop();
}

void JsonFeedSource::start(ObservationSink sink) {
    if (thread_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stopping_ = false;
    }
    thread_ = std::make_unique<std::thread>(&JsonFeedSource::pollLoop, this, std::move(sink));

    if (logging_module_) {
        logging_module_->log(LogLevel::INFO, "JsonFeedSource", "start", "Tailing " + path_,
                             __FILE__, __FUNCTION__, std::to_string(__LINE__));
    }
}

void JsonFeedSource::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stopping_ = true;
    }
    wait_cv_.notify_all();
    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
    thread_.reset();
}

void JsonFeedSource::pollLoop(ObservationSink sink) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    while (!stopping_) {
        lock.unlock();
        try {
            poll(sink);
        } catch (const std::exception& e) {
            if (logging_module_) {
                logging_module_->log(LogLevel::ERROR, "JsonFeedSource", "pollLoop",
                                     "Error while reading " + path_ + ": " + e.what(),
                                     __FILE__, __FUNCTION__, std::to_string(__LINE__));
            }
        }
        lock.lock();
        wait_cv_.wait_for(lock, poll_interval_, [this]() { return stopping_; });
    }
}

size_t JsonFeedSource::poll(const ObservationSink& sink) {
    std::error_code ec;
    auto file_size = std::filesystem::file_size(path_, ec);
    if (ec) {
        if (!missing_reported_ && logging_module_) {
            logging_module_->log(LogLevel::WARNING, "JsonFeedSource", "poll",
                                 "Feed not available: " + path_ + " (" + ec.message() + ")",
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
        missing_reported_ = true;
        return 0;
    }
    missing_reported_ = false;

    if (!positioned_) {
        position_ = start_at_end_ ? static_cast<std::streamoff>(file_size) : 0;
        positioned_ = true;
    }
    if (static_cast<std::streamoff>(file_size) < position_) {
        if (logging_module_) {
            logging_module_->log(LogLevel::INFO, "JsonFeedSource", "poll",
                                 "Feed shrank, reading " + path_ + " from the start",
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
        position_ = 0;
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return 0;
    }
    file.seekg(position_);

    size_t delivered = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (file.eof()) {
            // No trailing newline yet, the writer is mid-line
            break;
        }
        position_ = file.tellg();

        if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        ++lines_read_;

        try {
            auto observation = event_management::observationFromJson(nlohmann::json::parse(line));
            if (sink && sink(observation)) {
                ++delivered;
            }
        } catch (const std::exception& e) {
            ++malformed_lines_;
            if (logging_module_) {
                logging_module_->log(LogLevel::WARNING, "JsonFeedSource", "poll",
                                     "Skipping malformed line in " + path_ + ": " + e.what(),
                                     __FILE__, __FUNCTION__, std::to_string(__LINE__));
            }
        }
    }
    return delivered;
}

} // namespace monitoring
} // namespace sovereign_defense
