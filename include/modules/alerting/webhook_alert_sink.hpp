#pragma once

#include "modules/alerting/alert_sink.hpp"
#include "modules/config/defense_config.hpp"
#include "modules/logging/logging_module.hpp"
#include <memory>
#include <string>

namespace sovereign_defense {
namespace alerting {

enum class DeliveryResult {
    SUCCESS,
    FAILURE,
    RETRY,
    CONNECTION_ERROR,
    AUTHENTICATION_ERROR
};

std::string deliveryResultToString(DeliveryResult result);

/**
 * @brief Posts the alert JSON to an HTTP(S) endpoint with libcurl
 */
class WebhookAlertSink : public AlertSink {
public:
    WebhookAlertSink(const config::WebhookSinkConfig& config,
                     std::shared_ptr<logging::LoggingModule> logging_module = nullptr);
    ~WebhookAlertSink() override;

    std::string name() const override { return "webhook"; }
    bool notify(const AlertRequest& request) override;

    /**
     * @brief Sends one JSON document
     */
    DeliveryResult post(const nlohmann::json& body);

    /**
     * @brief Maps an HTTP status code onto a delivery result
     */
    static DeliveryResult classifyStatus(long http_code);

private:
    config::WebhookSinkConfig config_;
    std::shared_ptr<logging::LoggingModule> logging_module_;
};

} // namespace alerting
} // namespace sovereign_defense
