#include "modules/alerting/alert_sink.hpp"
#include <stdexcept>

namespace sovereign_defense {
namespace alerting {

using event_management::SeverityLevel;
using logging::LogLevel;

namespace {

LogLevel levelFor(SeverityLevel severity) {
    switch (severity) {
        case SeverityLevel::LOW: return LogLevel::INFO;
        case SeverityLevel::MEDIUM: return LogLevel::WARNING;
        case SeverityLevel::HIGH: return LogLevel::ERROR;
        case SeverityLevel::CRITICAL: return LogLevel::CRITICAL;
    }
    return LogLevel::WARNING;
}

} // namespace

LogAlertSink::LogAlertSink(std::shared_ptr<logging::LoggingModule> logging_module)
    : logging_module_(std::move(logging_module)) {
    if (!logging_module_) {
        throw std::invalid_argument("Log alert sink requires a logging module");
    }
}

bool LogAlertSink::notify(const AlertRequest& request) {
    std::string message = "[" + alertCategoryToString(request.category) + "] " + request.title;
    if (request.source) {
        message += " from " + request.source->key();
    }
    logging_module_->log(levelFor(request.severity), "Alert", request.title, message,
                         __FILE__, __FUNCTION__, std::to_string(__LINE__), request.toJson());
    return true;
}

} // namespace alerting
} // namespace sovereign_defense
