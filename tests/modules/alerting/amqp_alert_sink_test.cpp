#include "modules/alerting/amqp_alert_sink.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace testing;
using namespace sovereign_defense::alerting;
using sovereign_defense::event_management::SeverityLevel;

// RabbitMQ mock
class MockRabbitMQ : public RabbitMQInterface {
public:
    MOCK_METHOD(amqp_connection_state_t, amqp_new_connection, (), (override));
    MOCK_METHOD(amqp_socket_t*, amqp_tcp_socket_new, (amqp_connection_state_t state), (override));
    MOCK_METHOD(int, amqp_socket_open, (amqp_socket_t* socket, const char* host, int port), (override));
    MOCK_METHOD(amqp_rpc_reply_t, amqp_login, (amqp_connection_state_t state, const char* vhost, int channel_max, int frame_max, int heartbeat, amqp_sasl_method_enum sasl_method, const char* username, const char* password), (override));
    MOCK_METHOD(amqp_channel_open_ok_t*, amqp_channel_open, (amqp_connection_state_t state, amqp_channel_t channel), (override));
    MOCK_METHOD(amqp_rpc_reply_t, amqp_get_rpc_reply, (amqp_connection_state_t state), (override));
    MOCK_METHOD(amqp_rpc_reply_t, amqp_channel_close, (amqp_connection_state_t state, amqp_channel_t channel, int code), (override));
    MOCK_METHOD(amqp_rpc_reply_t, amqp_connection_close, (amqp_connection_state_t state, int code), (override));
    MOCK_METHOD(int, amqp_destroy_connection, (amqp_connection_state_t state), (override));
    MOCK_METHOD(amqp_exchange_declare_ok_t*, amqp_exchange_declare, (amqp_connection_state_t state, amqp_channel_t channel, amqp_bytes_t exchange, amqp_bytes_t type, amqp_boolean_t passive, amqp_boolean_t durable, amqp_boolean_t auto_delete, amqp_boolean_t internal, amqp_table_t arguments), (override));
    MOCK_METHOD(int, amqp_basic_publish, (amqp_connection_state_t state, amqp_channel_t channel, amqp_bytes_t exchange, amqp_bytes_t routing_key, amqp_boolean_t mandatory, amqp_boolean_t immediate, const amqp_basic_properties_t* properties, amqp_bytes_t body), (override));
};

namespace {

std::string toString(amqp_bytes_t bytes) {
    return std::string(static_cast<const char*>(bytes.bytes), bytes.len);
}

} // namespace

class AmqpAlertSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        rabbitmq_ = std::make_shared<NiceMock<MockRabbitMQ>>();
        config_.enabled = true;
        config_.exchange = "defense.alerts";
        config_.routing_key_prefix = "alert";

        fake_conn_ = (amqp_connection_state_t)1;
        fake_socket_ = (amqp_socket_t*)1;
        amqp_rpc_reply_t fake_reply = {AMQP_RESPONSE_NORMAL};

        ON_CALL(*rabbitmq_, amqp_new_connection()).WillByDefault(Return(fake_conn_));
        ON_CALL(*rabbitmq_, amqp_tcp_socket_new(_)).WillByDefault(Return(fake_socket_));
        ON_CALL(*rabbitmq_, amqp_socket_open(_, _, _)).WillByDefault(Return(AMQP_STATUS_OK));
        ON_CALL(*rabbitmq_, amqp_login(_, _, _, _, _, _, _, _)).WillByDefault(Return(fake_reply));
        ON_CALL(*rabbitmq_, amqp_get_rpc_reply(_)).WillByDefault(Return(fake_reply));
        ON_CALL(*rabbitmq_, amqp_channel_close(_, _, _)).WillByDefault(Return(fake_reply));
        ON_CALL(*rabbitmq_, amqp_connection_close(_, _)).WillByDefault(Return(fake_reply));
    }

    static AlertRequest ledgerHalted() {
        return AlertRequest::system(SeverityLevel::CRITICAL, "ledger_halted",
                                    nlohmann::json{{"reason", "record hash mismatch"}});
    }

    std::shared_ptr<NiceMock<MockRabbitMQ>> rabbitmq_;
    sovereign_defense::config::AmqpSinkConfig config_;
    amqp_connection_state_t fake_conn_;
    amqp_socket_t* fake_socket_;
};

TEST_F(AmqpAlertSinkTest, PublishesToTopicExchange) {
    std::string routing_key;
    std::string body;
    EXPECT_CALL(*rabbitmq_, amqp_exchange_declare(fake_conn_, 1, _, _, 0, 1, 0, 0, _))
        .WillOnce(Invoke([](amqp_connection_state_t, amqp_channel_t, amqp_bytes_t exchange, amqp_bytes_t type,
                            amqp_boolean_t, amqp_boolean_t, amqp_boolean_t, amqp_boolean_t,
                            amqp_table_t) -> amqp_exchange_declare_ok_t* {
            EXPECT_EQ(toString(exchange), "defense.alerts");
            EXPECT_EQ(toString(type), "topic");
            return nullptr;
        }));
    EXPECT_CALL(*rabbitmq_, amqp_basic_publish(fake_conn_, 1, _, _, 0, 0, _, _))
        .Times(2)
        .WillRepeatedly(Invoke([&](amqp_connection_state_t, amqp_channel_t, amqp_bytes_t, amqp_bytes_t key,
                                   amqp_boolean_t, amqp_boolean_t, const amqp_basic_properties_t*,
                                   amqp_bytes_t payload) -> int {
            routing_key = toString(key);
            body = toString(payload);
            return AMQP_STATUS_OK;
        }));

    AmqpAlertSink sink(config_, nullptr, rabbitmq_);
    EXPECT_TRUE(sink.notify(ledgerHalted()));
    EXPECT_TRUE(sink.isConnected());
    EXPECT_TRUE(sink.notify(ledgerHalted()));

    EXPECT_EQ(routing_key, "alert.system.ledger_halted.critical");
    auto json = nlohmann::json::parse(body);
    EXPECT_EQ(json["category"], "system");
    EXPECT_EQ(json["details"]["reason"], "record hash mismatch");
}

TEST_F(AmqpAlertSinkTest, FailedLoginReportsFailure) {
    amqp_rpc_reply_t failed_reply = {AMQP_RESPONSE_SERVER_EXCEPTION};
    EXPECT_CALL(*rabbitmq_, amqp_login(_, _, _, _, _, _, _, _)).WillOnce(Return(failed_reply));
    EXPECT_CALL(*rabbitmq_, amqp_destroy_connection(fake_conn_)).Times(1);
    EXPECT_CALL(*rabbitmq_, amqp_basic_publish(_, _, _, _, _, _, _, _)).Times(0);

    AmqpAlertSink sink(config_, nullptr, rabbitmq_);
    EXPECT_FALSE(sink.notify(ledgerHalted()));
    EXPECT_FALSE(sink.isConnected());
}

TEST_F(AmqpAlertSinkTest, PublishFailureDropsConnection) {
    EXPECT_CALL(*rabbitmq_, amqp_new_connection()).Times(2).WillRepeatedly(Return(fake_conn_));
    EXPECT_CALL(*rabbitmq_, amqp_basic_publish(_, _, _, _, _, _, _, _))
        .WillOnce(Return(AMQP_STATUS_SOCKET_ERROR))
        .WillOnce(Return(AMQP_STATUS_OK));

    AmqpAlertSink sink(config_, nullptr, rabbitmq_);
    EXPECT_FALSE(sink.notify(ledgerHalted()));
    EXPECT_FALSE(sink.isConnected());
    EXPECT_TRUE(sink.notify(ledgerHalted()));
}

TEST_F(AmqpAlertSinkTest, RoutingKeyWithoutPrefix) {
    config_.routing_key_prefix = "";
    AmqpAlertSink sink(config_, nullptr, rabbitmq_);
    EXPECT_EQ(sink.routingKeyFor(ledgerHalted()), "system.ledger_halted.critical");
    EXPECT_THROW(AmqpAlertSink(config_, nullptr, nullptr), std::invalid_argument);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
