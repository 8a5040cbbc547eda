#ifndef TELEMETRY_PUBLISHER_HPP
#define TELEMETRY_PUBLISHER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <main/models/publish_counters.hpp>
#include <main/models/telemetry_message.hpp>
#include <main/network/transport.hpp>
#include <main/state/pipeline_settings.hpp>

// Publish-only MQTT client. Every publish() opens its own connection,
// sends CONNECT, waits for CONNACK, sends one QoS0 PUBLISH and DISCONNECT,
// then closes. Nothing is retried or queued.
//
// A publisher and its transport belong to one cadence task; give every task
// its own pair so a slow broker exchange never holds up another cadence.
// counters() may be read from any task.
//
// Error mapping:
//   connect timed out or failed   CONNECT_TIMEOUT
//   connect actively refused      BROKER_REJECTED
//   no CONNACK in time            CONNECT_TIMEOUT
//   CONNACK refused or malformed  BROKER_REJECTED
//   any frame write failed        WRITE_FAILED
//   frame cannot be encoded       ENCODING_ERROR (transport untouched)
class TelemetryPublisher {
public:
    TelemetryPublisher(Transport& transport, const PipelineSettings& settings);

    PublishCycleResult publish(const TelemetryMessage& message);

    PublishCounters counters() const;

private:
    PublishError exchange(const TelemetryMessage& message, const uint8_t* connect_frame, std::size_t connect_len,
                          const uint8_t* publish_frame, std::size_t publish_len);
    PublishCycleResult finish(PublishError error, const char* topic);

    Transport& transport;
    const PipelineSettings& settings;

    std::atomic<uint32_t> success_count;
    std::atomic<uint32_t> failure_count;
};

#endif // TELEMETRY_PUBLISHER_HPP
