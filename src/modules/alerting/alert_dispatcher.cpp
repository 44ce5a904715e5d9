#include "modules/alerting/alert_dispatcher.hpp"
#include "modules/alerting/amqp_alert_sink.hpp"
#include "modules/alerting/webhook_alert_sink.hpp"

namespace sovereign_defense {
namespace alerting {

using logging::LogLevel;

AlertDispatcher::AlertDispatcher(const config::AlertingConfig& config,
                                 std::shared_ptr<logging::LoggingModule> logging_module)
    : config_(config)
    , logging_module_(std::move(logging_module))
    , queue_(config.queue_size) {}

AlertDispatcher::~AlertDispatcher() {
    stop();
}

void AlertDispatcher::addSink(std::shared_ptr<AlertSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

size_t AlertDispatcher::sinkCount() const {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    return sinks_.size();
}

void AlertDispatcher::start() {
    if (worker_) {
        return;
    }
    worker_ = std::make_unique<std::thread>(&AlertDispatcher::workerLoop, this);
}

void AlertDispatcher::stop() {
    queue_.close();
    if (worker_ && worker_->joinable()) {
        worker_->join();
    }
}

bool AlertDispatcher::notify(const AlertRequest& request) {
    if (request.category == AlertCategory::SECURITY_EVENT && request.severity < config_.min_severity) {
        ++filtered_;
        return false;
    }

    std::optional<AlertRequest> dropped;
    if (!queue_.pushDropOldest(request, dropped)) {
        return false;
    }
    if (dropped) {
        ++dropped_;
        if (logging_module_) {
            logging_module_->log(LogLevel::WARNING, "AlertDispatcher", "notify",
                                 "Queue full, dropped alert " + dropped->topic(),
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
    }
    return true;
}

void AlertDispatcher::workerLoop() {
    while (auto request = queue_.pop()) {
        deliver(*request);
    }
}

void AlertDispatcher::deliver(const AlertRequest& request) {
    std::vector<std::shared_ptr<AlertSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks = sinks_;
    }

    for (const auto& sink : sinks) {
        bool ok = false;
        std::string error;
        try {
            ok = sink->notify(request);
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (ok) {
            ++delivered_;
            continue;
        }
        ++failed_;
        if (logging_module_) {
            logging_module_->log(LogLevel::WARNING, "AlertDispatcher", "deliver",
                                 "Sink " + sink->name() + " failed to deliver " + request.topic() +
                                 (error.empty() ? "" : ": " + error),
                                 __FILE__, __FUNCTION__, std::to_string(__LINE__));
        }
    }
}

std::vector<std::shared_ptr<AlertSink>> createAlertSinks(const config::AlertingConfig& config,
                                                         std::shared_ptr<logging::LoggingModule> logging_module) {
    std::vector<std::shared_ptr<AlertSink>> sinks;
    if (config.log_sink && logging_module) {
        sinks.push_back(std::make_shared<LogAlertSink>(logging_module));
    }
    if (config.webhook.enabled) {
        sinks.push_back(std::make_shared<WebhookAlertSink>(config.webhook, logging_module));
    }
    if (config.amqp.enabled) {
        sinks.push_back(std::make_shared<AmqpAlertSink>(config.amqp, logging_module));
    }
    return sinks;
}

} // namespace alerting
} // namespace sovereign_defense
