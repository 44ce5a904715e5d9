#pragma once

#include "modules/alerting/alert_request.hpp"
#include "modules/logging/logging_module.hpp"
#include <memory>
#include <string>

namespace sovereign_defense {
namespace alerting {

/**
 * @brief Notification transport
 *
 * notify() is called from the alert dispatcher thread only. Failures are
 * reported through the return value or an exception; the dispatcher logs
 * them and moves on.
 */
class AlertSink {
public:
    virtual ~AlertSink() = default;

    virtual std::string name() const = 0;
    virtual bool notify(const AlertRequest& request) = 0;
};

/**
 * @brief Writes alerts to the logging module
 */
class LogAlertSink : public AlertSink {
public:
    explicit LogAlertSink(std::shared_ptr<logging::LoggingModule> logging_module);

    std::string name() const override { return "log"; }
    bool notify(const AlertRequest& request) override;

private:
    std::shared_ptr<logging::LoggingModule> logging_module_;
};

} // namespace alerting
} // namespace sovereign_defense
