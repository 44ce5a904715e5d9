#pragma once

#include "modules/alerting/alert_sink.hpp"
#include "modules/alerting/rabbitmq_interface.hpp"
#include "modules/config/defense_config.hpp"
#include "modules/logging/logging_module.hpp"
#include <memory>
#include <string>

namespace sovereign_defense {
namespace alerting {

/**
 * @brief Publishes alerts to a RabbitMQ topic exchange
 *
 * The connection is opened lazily and kept; a failed publish drops it so
 * the next alert reconnects. Routing key is "<prefix>.<alert topic>".
 */
class AmqpAlertSink : public AlertSink {
public:
    AmqpAlertSink(const config::AmqpSinkConfig& config,
                  std::shared_ptr<logging::LoggingModule> logging_module = nullptr,
                  std::shared_ptr<RabbitMQInterface> rabbitmq = std::make_shared<RealRabbitMQ>());
    ~AmqpAlertSink() override;

    std::string name() const override { return "amqp"; }
    bool notify(const AlertRequest& request) override;

    bool isConnected() const { return conn_ != nullptr; }
    std::string routingKeyFor(const AlertRequest& request) const;

private:
    bool connect();
    void disconnect();
    void logFailure(const std::string& function, const std::string& message) const;

    config::AmqpSinkConfig config_;
    std::shared_ptr<logging::LoggingModule> logging_module_;
    std::shared_ptr<RabbitMQInterface> rabbitmq_;
    amqp_connection_state_t conn_ = nullptr;
};

} // namespace alerting
} // namespace sovereign_defense
