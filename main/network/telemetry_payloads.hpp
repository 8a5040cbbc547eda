#ifndef TELEMETRY_PAYLOADS_HPP
#define TELEMETRY_PAYLOADS_HPP

#include <cstdint>
#include <main/models/device_health.hpp>
#include <main/models/measurement.hpp>
#include <main/models/telemetry_message.hpp>

// Topic and JSON payload builders. Each returns false if the topic or the
// payload does not fit the message buffers.
namespace TelemetryPayloads {
    // <prefix>/sensor/<type>
    // {"temperature":23.50,"humidity":68.2,"pressure":1013.8,"reading":42}
    bool buildSensor(const char* prefix, const char* sensor_type, const Measurement& m, TelemetryMessage& out);

    // <prefix>/heartbeat  {"message":"alive","sequence":123}
    bool buildHeartbeat(const char* prefix, uint32_t sequence, TelemetryMessage& out);

    // <prefix>/status  {"status":"online","uptime":3600,"free_heap":45000,"wifi_rssi":-42}
    bool buildStatus(const char* prefix, const DeviceHealth& health, TelemetryMessage& out);
}

#endif // TELEMETRY_PAYLOADS_HPP
