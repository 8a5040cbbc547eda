#include <main/network/telemetry_payloads.hpp>
#include <main/config/config.hpp>
#include <cstdio>

namespace {
    static bool fits(int n, std::size_t cap) {
        return n > 0 && static_cast<std::size_t>(n) < cap;
    }

    static bool finishPayload(int n, TelemetryMessage& out) {
        if (!fits(n, sizeof(out.payload))) {
            out.payload_len = 0;
            return false;
        }
        out.payload_len = static_cast<std::size_t>(n);
        return true;
    }
}

namespace TelemetryPayloads {

bool buildSensor(const char* prefix, const char* sensor_type, const Measurement& m, TelemetryMessage& out) {
    int t = std::snprintf(out.topic, sizeof(out.topic), Config::Mqtt::Topics::SENSOR, prefix, sensor_type);
    if (!fits(t, sizeof(out.topic))) {
        return false;
    }
    int n;
    if (m.has_humidity) {
        n = std::snprintf(out.payload, sizeof(out.payload),
                          "{\"temperature\":%.2f,\"humidity\":%.1f,\"pressure\":%.1f,\"reading\":%lu}",
                          static_cast<double>(m.temperature_c),
                          static_cast<double>(m.humidity_pct),
                          static_cast<double>(m.pressure_hpa),
                          static_cast<unsigned long>(m.sequence));
    } else {
        n = std::snprintf(out.payload, sizeof(out.payload),
                          "{\"temperature\":%.2f,\"pressure\":%.1f,\"reading\":%lu}",
                          static_cast<double>(m.temperature_c),
                          static_cast<double>(m.pressure_hpa),
                          static_cast<unsigned long>(m.sequence));
    }
    return finishPayload(n, out);
}

bool buildHeartbeat(const char* prefix, uint32_t sequence, TelemetryMessage& out) {
    int t = std::snprintf(out.topic, sizeof(out.topic), Config::Mqtt::Topics::HEARTBEAT, prefix);
    if (!fits(t, sizeof(out.topic))) {
        return false;
    }
    int n = std::snprintf(out.payload, sizeof(out.payload), "{\"message\":\"alive\",\"sequence\":%lu}",
                          static_cast<unsigned long>(sequence));
    return finishPayload(n, out);
}

bool buildStatus(const char* prefix, const DeviceHealth& health, TelemetryMessage& out) {
    int t = std::snprintf(out.topic, sizeof(out.topic), Config::Mqtt::Topics::STATUS, prefix);
    if (!fits(t, sizeof(out.topic))) {
        return false;
    }
    int n = std::snprintf(out.payload, sizeof(out.payload),
                          "{\"status\":\"%s\",\"uptime\":%lu,\"free_heap\":%lu,\"wifi_rssi\":%d}",
                          health.connected ? "online" : "offline",
                          static_cast<unsigned long>(health.uptime_s),
                          static_cast<unsigned long>(health.free_heap_bytes),
                          static_cast<int>(health.wifi_rssi_dbm));
    return finishPayload(n, out);
}

}
