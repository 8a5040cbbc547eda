#include <main/network/telemetry_publisher.hpp>
#include <main/network/telemetry_payloads.hpp>
#include <cstring>
#include "fakes.hpp"
#include "test_support.hpp"

static TelemetryMessage heartbeat(uint32_t sequence)
{
    TelemetryMessage msg{};
    TelemetryPayloads::buildHeartbeat("envmon", sequence, msg);
    return msg;
}

static PipelineSettings testSettings()
{
    PipelineSettings s = PipelineSettings::defaults();
    std::snprintf(s.mqtt_host, sizeof(s.mqtt_host), "%s", "10.10.10.210");
    s.mqtt_port = 1883;
    std::snprintf(s.client_id, sizeof(s.client_id), "%s", "envmon-01");
    return s;
}

static void test_successful_publish_sequence()
{
    FakeTransport transport;
    PipelineSettings settings = testSettings();
    TelemetryPublisher publisher(transport, settings);

    TelemetryMessage msg = heartbeat(7);
    PublishCycleResult r = publisher.publish(msg);
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(r.error == PublishError::OK);

    EXPECT_EQ_INT(transport.connects, 1);
    EXPECT_EQ_INT(transport.closes, 1);
    EXPECT_FALSE(transport.open);
    EXPECT_STREQ(transport.last_host, "10.10.10.210");
    EXPECT_EQ_INT(transport.last_port, 1883);
    EXPECT_EQ_INT(transport.last_connect_timeout_ms, 3000);
    EXPECT_EQ_INT(transport.last_read_timeout_ms, 2000);

    // CONNECT, PUBLISH, DISCONNECT in that order
    EXPECT_EQ_INT(transport.frames.size(), 3);
    if (transport.frames.size() == 3)
    {
        EXPECT_EQ_INT(transport.frames[0][0], 0x10);
        EXPECT_EQ_INT(transport.frames[1][0], 0x30);
        const std::vector<uint8_t>& pub = transport.frames[1];
        const std::size_t topic_len = (pub[2] << 8) | pub[3];
        EXPECT_EQ_INT(topic_len, std::strlen("envmon/heartbeat"));
        EXPECT_TRUE(std::memcmp(&pub[4], "envmon/heartbeat", topic_len) == 0);
        EXPECT_TRUE(std::memcmp(&pub[4 + topic_len], msg.payload, msg.payload_len) == 0);
        EXPECT_EQ_INT(transport.frames[2][0], 0xE0);
        EXPECT_EQ_INT(transport.frames[2][1], 0x00);
    }

    PublishCounters c = publisher.counters();
    EXPECT_EQ_INT(c.success, 1);
    EXPECT_EQ_INT(c.failure, 0);
}

static void test_one_connection_per_publish()
{
    FakeTransport transport;
    PipelineSettings settings = testSettings();
    TelemetryPublisher publisher(transport, settings);
    for (uint32_t i = 1; i <= 5; ++i)
    {
        EXPECT_TRUE(publisher.publish(heartbeat(i)).success);
    }
    EXPECT_EQ_INT(transport.connects, 5);
    EXPECT_EQ_INT(transport.closes, 5);
    EXPECT_EQ_INT(publisher.counters().success, 5);
}

static void test_broker_rejects_then_next_cycle_reconnects()
{
    FakeTransport transport;
    PipelineSettings settings = testSettings();
    TelemetryPublisher publisher(transport, settings);

    transport.connack[3] = 0x05; // not authorized
    PublishCycleResult r = publisher.publish(heartbeat(1));
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.error == PublishError::BROKER_REJECTED);
    EXPECT_EQ_INT(transport.connects, 1);
    EXPECT_EQ_INT(transport.closes, 1);
    // Nothing after CONNECT
    EXPECT_EQ_INT(transport.frames.size(), 1);

    transport.connack[3] = 0x00;
    r = publisher.publish(heartbeat(2));
    EXPECT_TRUE(r.success);
    EXPECT_EQ_INT(transport.connects, 2);
    EXPECT_EQ_INT(transport.closes, 2);

    PublishCounters c = publisher.counters();
    EXPECT_EQ_INT(c.success, 1);
    EXPECT_EQ_INT(c.failure, 1);
}

static void test_malformed_connack_is_rejected()
{
    FakeTransport transport;
    PipelineSettings settings = testSettings();
    TelemetryPublisher publisher(transport, settings);
    transport.connack[0] = 0x30;
    EXPECT_TRUE(publisher.publish(heartbeat(1)).error == PublishError::BROKER_REJECTED);
    EXPECT_EQ_INT(transport.closes, 1);
}

static void test_connect_failures()
{
    FakeTransport transport;
    PipelineSettings settings = testSettings();
    TelemetryPublisher publisher(transport, settings);

    transport.connect_status = TransportStatus::TIMEOUT;
    EXPECT_TRUE(publisher.publish(heartbeat(1)).error == PublishError::CONNECT_TIMEOUT);
    // Nothing listening on the broker port
    transport.connect_status = TransportStatus::REFUSED;
    EXPECT_TRUE(publisher.publish(heartbeat(2)).error == PublishError::BROKER_REJECTED);
    EXPECT_EQ_INT(transport.connects, 2);
    EXPECT_EQ_INT(transport.closes, 2);
    EXPECT_EQ_INT(transport.frames.size(), 0);

    // Connected but no CONNACK in time
    transport.connect_status = TransportStatus::OK;
    transport.read_status = TransportStatus::TIMEOUT;
    EXPECT_TRUE(publisher.publish(heartbeat(3)).error == PublishError::CONNECT_TIMEOUT);
    EXPECT_EQ_INT(transport.closes, 3);
    EXPECT_EQ_INT(publisher.counters().failure, 3);
}

static void test_write_failures()
{
    FakeTransport transport;
    PipelineSettings settings = testSettings();
    TelemetryPublisher publisher(transport, settings);

    transport.fail_write_call = 1; // CONNECT
    EXPECT_TRUE(publisher.publish(heartbeat(1)).error == PublishError::WRITE_FAILED);
    EXPECT_EQ_INT(transport.closes, 1);

    transport.reset();
    transport.fail_write_call = 2; // PUBLISH
    EXPECT_TRUE(publisher.publish(heartbeat(2)).error == PublishError::WRITE_FAILED);
    EXPECT_EQ_INT(transport.connects, 1);
    EXPECT_EQ_INT(transport.closes, 1);

    // A failed DISCONNECT does not change the outcome
    transport.reset();
    transport.fail_write_call = 3;
    EXPECT_TRUE(publisher.publish(heartbeat(3)).success);
    EXPECT_EQ_INT(transport.closes, 1);
}

static void test_encoding_error_never_opens_transport()
{
    FakeTransport transport;
    PipelineSettings settings = testSettings();
    TelemetryPublisher publisher(transport, settings);

    TelemetryMessage empty_topic = heartbeat(1);
    empty_topic.topic[0] = '\0';
    EXPECT_TRUE(publisher.publish(empty_topic).error == PublishError::ENCODING_ERROR);

    TelemetryMessage oversized = heartbeat(1);
    oversized.payload_len = sizeof(oversized.payload) + 1;
    EXPECT_TRUE(publisher.publish(oversized).error == PublishError::ENCODING_ERROR);

    PipelineSettings bad_id = testSettings();
    bad_id.client_id[0] = '\0';
    TelemetryPublisher no_id(transport, bad_id);
    EXPECT_TRUE(no_id.publish(heartbeat(1)).error == PublishError::ENCODING_ERROR);

    EXPECT_EQ_INT(transport.connects, 0);
    EXPECT_EQ_INT(transport.closes, 0);
    EXPECT_EQ_INT(publisher.counters().failure, 2);
}

int main()
{
    test_successful_publish_sequence();
    test_one_connection_per_publish();
    test_broker_rejects_then_next_cycle_reconnects();
    test_malformed_connack_is_rejected();
    test_connect_failures();
    test_write_failures();
    test_encoding_error_never_opens_transport();
    return testResult("telemetry_publisher");
}
