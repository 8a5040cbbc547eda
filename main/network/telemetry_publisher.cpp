#include <main/network/telemetry_publisher.hpp>
#include <main/network/mqtt_codec.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "PUBLISHER";

namespace {
    // CONNECT with a client id of at most 23 bytes fits in 39
    static constexpr std::size_t CONNECT_FRAME_CAP = 64;
    // fixed header (1) + remaining length (4) + topic length (2) + topic + payload
    static constexpr std::size_t PUBLISH_FRAME_CAP =
        1 + 4 + 2 + sizeof(TelemetryMessage::topic) + sizeof(TelemetryMessage::payload);
}

TelemetryPublisher::TelemetryPublisher(Transport& transport_in, const PipelineSettings& settings_in)
    : transport(transport_in),
      settings(settings_in),
      success_count(0),
      failure_count(0) {}

PublishCycleResult TelemetryPublisher::publish(const TelemetryMessage& message) {
    uint8_t connect_frame[CONNECT_FRAME_CAP];
    uint8_t publish_frame[PUBLISH_FRAME_CAP];

    // Encode up front so a bad frame never touches the network
    std::size_t publish_len = 0;
    if (message.payload_len <= sizeof(message.payload)) {
        publish_len = MqttCodec::encodePublish(message.topic,
                                               reinterpret_cast<const uint8_t*>(message.payload),
                                               message.payload_len, publish_frame, sizeof(publish_frame));
    }
    if (publish_len == 0) {
        LOG_ERROR(TAG, "Cannot encode PUBLISH for topic '%.*s' (%u bytes payload)",
                  static_cast<int>(sizeof(message.topic)), message.topic,
                  static_cast<unsigned>(message.payload_len));
        return finish(PublishError::ENCODING_ERROR, message.topic);
    }
    const std::size_t connect_len = MqttCodec::encodeConnect(settings.client_id, settings.keepalive_seconds,
                                                             connect_frame, sizeof(connect_frame));
    if (connect_len == 0) {
        LOG_ERROR(TAG, "Cannot encode CONNECT for client id '%s'", settings.client_id);
        return finish(PublishError::ENCODING_ERROR, message.topic);
    }

    TransportStatus st = transport.connect(settings.mqtt_host, static_cast<uint16_t>(settings.mqtt_port),
                                           settings.connect_timeout_ms);
    if (st != TransportStatus::OK) {
        LOG_WARN(TAG, "Broker %s:%lu unreachable: %s", settings.mqtt_host,
                 static_cast<unsigned long>(settings.mqtt_port), toString(st));
        transport.close();
        return finish(st == TransportStatus::REFUSED ? PublishError::BROKER_REJECTED : PublishError::CONNECT_TIMEOUT,
                      message.topic);
    }

    PublishError err = exchange(message, connect_frame, connect_len, publish_frame, publish_len);

    // Best-effort; the outcome is already decided
    if (err != PublishError::BROKER_REJECTED) {
        uint8_t disconnect_frame[2];
        std::size_t n = MqttCodec::encodeDisconnect(disconnect_frame, sizeof(disconnect_frame));
        TransportStatus dst = transport.write(disconnect_frame, n, settings.write_timeout_ms);
        if (dst != TransportStatus::OK) {
            LOG_DEBUG(TAG, "DISCONNECT not sent: %s", toString(dst));
        }
    }
    transport.close();
    return finish(err, message.topic);
}

PublishError TelemetryPublisher::exchange(const TelemetryMessage& message, const uint8_t* connect_frame,
                                          std::size_t connect_len, const uint8_t* publish_frame,
                                          std::size_t publish_len) {
    TransportStatus st = transport.write(connect_frame, connect_len, settings.write_timeout_ms);
    if (st != TransportStatus::OK) {
        LOG_WARN(TAG, "CONNECT write failed: %s", toString(st));
        return PublishError::WRITE_FAILED;
    }

    uint8_t connack[MqttCodec::CONNACK_LEN];
    st = transport.read(connack, sizeof(connack), settings.connack_timeout_ms);
    if (st == TransportStatus::TIMEOUT) {
        LOG_WARN(TAG, "No CONNACK within %lu ms", static_cast<unsigned long>(settings.connack_timeout_ms));
        return PublishError::CONNECT_TIMEOUT;
    }
    if (st != TransportStatus::OK) {
        // Broker hung up instead of acknowledging
        LOG_WARN(TAG, "CONNACK read failed: %s", toString(st));
        return PublishError::BROKER_REJECTED;
    }
    uint8_t return_code = 0xFF;
    MqttCodec::ConnackResult ack = MqttCodec::parseConnack(connack, sizeof(connack), return_code);
    if (ack == MqttCodec::ConnackResult::MALFORMED) {
        LOG_WARN(TAG, "Malformed CONNACK %02X %02X %02X %02X", connack[0], connack[1], connack[2], connack[3]);
        return PublishError::BROKER_REJECTED;
    }
    if (ack == MqttCodec::ConnackResult::REFUSED) {
        LOG_WARN(TAG, "Broker refused connection, return code %u", static_cast<unsigned>(return_code));
        return PublishError::BROKER_REJECTED;
    }

    st = transport.write(publish_frame, publish_len, settings.write_timeout_ms);
    if (st != TransportStatus::OK) {
        LOG_WARN(TAG, "PUBLISH write to %s failed: %s", message.topic, toString(st));
        return PublishError::WRITE_FAILED;
    }
    return PublishError::OK;
}

PublishCycleResult TelemetryPublisher::finish(PublishError error, const char* topic) {
    if (error == PublishError::OK) {
        success_count.fetch_add(1);
        LOG_DEBUG(TAG, "Published to %s", topic);
    } else {
        failure_count.fetch_add(1);
        LOG_WARN(TAG, "Publish to %.*s failed: %s", static_cast<int>(sizeof(TelemetryMessage::topic)), topic,
                 toString(error));
    }
    PublishCycleResult result;
    result.success = (error == PublishError::OK);
    result.error = error;
    return result;
}

PublishCounters TelemetryPublisher::counters() const {
    PublishCounters c;
    c.success = success_count.load();
    c.failure = failure_count.load();
    return c;
}
