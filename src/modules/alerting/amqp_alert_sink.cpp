#include "modules/alerting/amqp_alert_sink.hpp"
#include <stdexcept>

namespace sovereign_defense {
namespace alerting {

using logging::LogLevel;

namespace {

const amqp_channel_t kChannel = 1;

} // namespace

AmqpAlertSink::AmqpAlertSink(const config::AmqpSinkConfig& config,
                             std::shared_ptr<logging::LoggingModule> logging_module,
                             std::shared_ptr<RabbitMQInterface> rabbitmq)
    : config_(config)
    , logging_module_(std::move(logging_module))
    , rabbitmq_(std::move(rabbitmq)) {
    if (!rabbitmq_) {
        throw std::invalid_argument("AMQP alert sink requires a RabbitMQ interface");
    }
}

AmqpAlertSink::~AmqpAlertSink() {
    disconnect();
}

void AmqpAlertSink::logFailure(const std::string& function, const std::string& message) const {
    if (logging_module_) {
        logging_module_->log(LogLevel::WARNING, "AmqpAlertSink", function, message,
                             __FILE__, __FUNCTION__, std::to_string(__LINE__));
    }
}

bool AmqpAlertSink::connect() {
    amqp_connection_state_t conn = rabbitmq_->amqp_new_connection();
    if (!conn) {
        logFailure("connect", "Could not allocate connection");
        return false;
    }

    amqp_socket_t* socket = rabbitmq_->amqp_tcp_socket_new(conn);
    if (!socket) {
        rabbitmq_->amqp_destroy_connection(conn);
        logFailure("connect", "Could not create TCP socket");
        return false;
    }

    if (rabbitmq_->amqp_socket_open(socket, config_.host.c_str(), config_.port) != AMQP_STATUS_OK) {
        rabbitmq_->amqp_destroy_connection(conn);
        logFailure("connect", "Could not open socket to " + config_.host + ":" + std::to_string(config_.port));
        return false;
    }

    amqp_rpc_reply_t login_reply = rabbitmq_->amqp_login(conn, config_.vhost.c_str(), 0, 131072, 0,
                                                         AMQP_SASL_METHOD_PLAIN,
                                                         config_.username.c_str(), config_.password.c_str());
    if (login_reply.reply_type != AMQP_RESPONSE_NORMAL) {
        rabbitmq_->amqp_destroy_connection(conn);
        logFailure("connect", "Login failed for user " + config_.username);
        return false;
    }

    rabbitmq_->amqp_channel_open(conn, kChannel);
    if (rabbitmq_->amqp_get_rpc_reply(conn).reply_type != AMQP_RESPONSE_NORMAL) {
        rabbitmq_->amqp_connection_close(conn, AMQP_REPLY_SUCCESS);
        rabbitmq_->amqp_destroy_connection(conn);
        logFailure("connect", "Could not open channel");
        return false;
    }

    rabbitmq_->amqp_exchange_declare(conn, kChannel, amqp_cstring_bytes(config_.exchange.c_str()),
                                     amqp_cstring_bytes("topic"), 0, 1, 0, 0, amqp_empty_table);
    if (rabbitmq_->amqp_get_rpc_reply(conn).reply_type != AMQP_RESPONSE_NORMAL) {
        rabbitmq_->amqp_channel_close(conn, kChannel, AMQP_REPLY_SUCCESS);
        rabbitmq_->amqp_connection_close(conn, AMQP_REPLY_SUCCESS);
        rabbitmq_->amqp_destroy_connection(conn);
        logFailure("connect", "Could not declare exchange " + config_.exchange);
        return false;
    }

    conn_ = conn;
    return true;
}

void AmqpAlertSink::disconnect() {
    if (!conn_) {
        return;
    }
    rabbitmq_->amqp_channel_close(conn_, kChannel, AMQP_REPLY_SUCCESS);
    rabbitmq_->amqp_connection_close(conn_, AMQP_REPLY_SUCCESS);
    rabbitmq_->amqp_destroy_connection(conn_);
    conn_ = nullptr;
}

std::string AmqpAlertSink::routingKeyFor(const AlertRequest& request) const {
    if (config_.routing_key_prefix.empty()) {
        return request.topic();
    }
    return config_.routing_key_prefix + "." + request.topic();
}

bool AmqpAlertSink::notify(const AlertRequest& request) {
    if (!conn_ && !connect()) {
        return false;
    }

    std::string json_str = request.toJson().dump();
    std::string routing_key = routingKeyFor(request);

    amqp_basic_properties_t props;
    props._flags = AMQP_BASIC_CONTENT_TYPE_FLAG | AMQP_BASIC_DELIVERY_MODE_FLAG;
    props.content_type = amqp_cstring_bytes("application/json");
    props.delivery_mode = 2; // persistent

    int status = rabbitmq_->amqp_basic_publish(conn_, kChannel, amqp_cstring_bytes(config_.exchange.c_str()),
                                               amqp_cstring_bytes(routing_key.c_str()),
                                               0, 0, &props, amqp_cstring_bytes(json_str.c_str()));
    if (status != AMQP_STATUS_OK) {
        logFailure("notify", "Publish to " + config_.exchange + " failed with status " + std::to_string(status));
        disconnect();
        return false;
    }
    return true;
}

} // namespace alerting
} // namespace sovereign_defense
