#pragma once

#include <rabbitmq-c/amqp.h>
#include <rabbitmq-c/tcp_socket.h>

namespace sovereign_defense {
namespace alerting {

// Interface over the rabbitmq-c calls used by the AMQP sink
class RabbitMQInterface {
public:
    virtual ~RabbitMQInterface() = default;
    virtual amqp_connection_state_t amqp_new_connection() = 0;
    virtual amqp_socket_t* amqp_tcp_socket_new(amqp_connection_state_t state) = 0;
    virtual int amqp_socket_open(amqp_socket_t* socket, const char* host, int port) = 0;
    virtual amqp_rpc_reply_t amqp_login(amqp_connection_state_t state, const char* vhost, int channel_max, int frame_max, int heartbeat, amqp_sasl_method_enum sasl_method, const char* username, const char* password) = 0;
    virtual amqp_channel_open_ok_t* amqp_channel_open(amqp_connection_state_t state, amqp_channel_t channel) = 0;
    virtual amqp_rpc_reply_t amqp_get_rpc_reply(amqp_connection_state_t state) = 0;
    virtual amqp_rpc_reply_t amqp_channel_close(amqp_connection_state_t state, amqp_channel_t channel, int code) = 0;
    virtual amqp_rpc_reply_t amqp_connection_close(amqp_connection_state_t state, int code) = 0;
    virtual int amqp_destroy_connection(amqp_connection_state_t state) = 0;
    virtual amqp_exchange_declare_ok_t* amqp_exchange_declare(amqp_connection_state_t state, amqp_channel_t channel, amqp_bytes_t exchange, amqp_bytes_t type, amqp_boolean_t passive, amqp_boolean_t durable, amqp_boolean_t auto_delete, amqp_boolean_t internal, amqp_table_t arguments) = 0;
    virtual int amqp_basic_publish(amqp_connection_state_t state, amqp_channel_t channel, amqp_bytes_t exchange, amqp_bytes_t routing_key, amqp_boolean_t mandatory, amqp_boolean_t immediate, const amqp_basic_properties_t* properties, amqp_bytes_t body) = 0;
};

// Forwards to the real library
class RealRabbitMQ : public RabbitMQInterface {
public:
    amqp_connection_state_t amqp_new_connection() override { return ::amqp_new_connection(); }
    amqp_socket_t* amqp_tcp_socket_new(amqp_connection_state_t state) override { return ::amqp_tcp_socket_new(state); }
    int amqp_socket_open(amqp_socket_t* socket, const char* host, int port) override { return ::amqp_socket_open(socket, host, port); }
    amqp_rpc_reply_t amqp_login(amqp_connection_state_t state, const char* vhost, int channel_max, int frame_max, int heartbeat, amqp_sasl_method_enum sasl_method, const char* username, const char* password) override { return ::amqp_login(state, vhost, channel_max, frame_max, heartbeat, sasl_method, username, password); }
    amqp_channel_open_ok_t* amqp_channel_open(amqp_connection_state_t state, amqp_channel_t channel) override { return ::amqp_channel_open(state, channel); }
    amqp_rpc_reply_t amqp_get_rpc_reply(amqp_connection_state_t state) override { return ::amqp_get_rpc_reply(state); }
    amqp_rpc_reply_t amqp_channel_close(amqp_connection_state_t state, amqp_channel_t channel, int code) override { return ::amqp_channel_close(state, channel, code); }
    amqp_rpc_reply_t amqp_connection_close(amqp_connection_state_t state, int code) override { return ::amqp_connection_close(state, code); }
    int amqp_destroy_connection(amqp_connection_state_t state) override { return ::amqp_destroy_connection(state); }
    amqp_exchange_declare_ok_t* amqp_exchange_declare(amqp_connection_state_t state, amqp_channel_t channel, amqp_bytes_t exchange, amqp_bytes_t type, amqp_boolean_t passive, amqp_boolean_t durable, amqp_boolean_t auto_delete, amqp_boolean_t internal, amqp_table_t arguments) override { return ::amqp_exchange_declare(state, channel, exchange, type, passive, durable, auto_delete, internal, arguments); }
    int amqp_basic_publish(amqp_connection_state_t state, amqp_channel_t channel, amqp_bytes_t exchange, amqp_bytes_t routing_key, amqp_boolean_t mandatory, amqp_boolean_t immediate, const amqp_basic_properties_t* properties, amqp_bytes_t body) override { return ::amqp_basic_publish(state, channel, exchange, routing_key, mandatory, immediate, properties, body); }
};

} // namespace alerting
} // namespace sovereign_defense
