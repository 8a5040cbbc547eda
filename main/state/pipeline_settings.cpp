#include <main/state/pipeline_settings.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <mjson.h>
#include <arpa/inet.h>
#include <cstdio>
#include <cstring>

static const char* TAG = "SETTINGS";

namespace {
    // Copies src into dst; returns false (and leaves a truncated copy) if it does not fit
    static bool copyBounded(char* dst, std::size_t cap, const char* src) {
        int n = std::snprintf(dst, cap, "%s", src);
        return n >= 0 && static_cast<std::size_t>(n) < cap;
    }

    // -1 wrong type, 0 absent, 1 applied
    static int readString(const char* json, int len, const char* path, char* dst, std::size_t cap, bool& truncated) {
        const char* tok = nullptr;
        int tok_len = 0;
        int type = mjson_find(json, len, path, &tok, &tok_len);
        if (type == MJSON_TOK_INVALID) {
            return 0;
        }
        if (type != MJSON_TOK_STRING) {
            LOG_WARN(TAG, "%s: expected string", path);
            return -1;
        }
        // tok_len includes both quotes
        char scratch[SETTINGS_PASSWORD_MAX_LEN + 2];
        int n = mjson_get_string(json, len, path, scratch, sizeof(scratch));
        if (n < 0 || static_cast<std::size_t>(n) >= cap) {
            LOG_WARN(TAG, "%s: value too long (%d bytes raw)", path, tok_len - 2);
            truncated = true;
            dst[0] = '\0';
            return 1;
        }
        std::memcpy(dst, scratch, static_cast<std::size_t>(n) + 1);
        return 1;
    }

    static int readNumber(const char* json, int len, const char* path, double& out) {
        const char* tok = nullptr;
        int tok_len = 0;
        int type = mjson_find(json, len, path, &tok, &tok_len);
        if (type == MJSON_TOK_INVALID) {
            return 0;
        }
        if (type != MJSON_TOK_NUMBER || mjson_get_number(json, len, path, &out) != 1 || out < 0) {
            LOG_WARN(TAG, "%s: expected non-negative number", path);
            return -1;
        }
        return 1;
    }

    static int readU32(const char* json, int len, const char* path, uint32_t& dst) {
        double v = 0;
        int rc = readNumber(json, len, path, v);
        if (rc == 1) {
            if (v > 4294967295.0) {
                LOG_WARN(TAG, "%s: out of range", path);
                return -1;
            }
            dst = static_cast<uint32_t>(v);
        }
        return rc;
    }

    static bool lengthOk(const char* name, const char* value, std::size_t min_len, std::size_t max_len) {
        std::size_t n = std::strlen(value);
        if (n < min_len || n > max_len) {
            LOG_ERROR(TAG, "%s length %u outside %u..%u", name, static_cast<unsigned>(n),
                      static_cast<unsigned>(min_len), static_cast<unsigned>(max_len));
            return false;
        }
        return true;
    }
}

PipelineSettings PipelineSettings::defaults() {
    PipelineSettings s{};
    bool ok = true;
    ok &= copyBounded(s.wifi_ssid, sizeof(s.wifi_ssid), Config::Wifi::ssid);
    ok &= copyBounded(s.wifi_password, sizeof(s.wifi_password), Config::Wifi::password);
    ok &= copyBounded(s.mqtt_host, sizeof(s.mqtt_host), Config::Mqtt::host);
    ok &= copyBounded(s.client_id, sizeof(s.client_id), Config::Device::id);
    ok &= copyBounded(s.topic_prefix, sizeof(s.topic_prefix), Config::Mqtt::topic_prefix);
    s.truncated = !ok;

    s.association_timeout_ms = Config::Wifi::association_timeout_ms;
    s.lease_timeout_ms = Config::Wifi::lease_timeout_ms;
    s.reconnect_backoff_ms = Config::Wifi::reconnect_backoff_ms;

    s.mqtt_port = static_cast<uint32_t>(Config::Mqtt::port);
    s.keepalive_seconds = Config::Mqtt::keepalive_seconds;
    s.connect_timeout_ms = Config::Mqtt::connect_timeout_ms;
    s.connack_timeout_ms = Config::Mqtt::connack_timeout_ms;
    s.write_timeout_ms = Config::Mqtt::write_timeout_ms;

    s.measurement_period_ms = Config::Tasks::Measurement::period_ms;
    s.heartbeat_period_ms = Config::Tasks::Heartbeat::period_ms;
    s.status_period_ms = Config::Tasks::Status::period_ms;
    s.cadence_tolerance_ms = Config::Tasks::cadence_tolerance_ms;
    return s;
}

int PipelineSettings::applyJson(const char* json, int len) {
    if (json == nullptr || len <= 0) {
        return 0;
    }
    if (mjson(json, len, nullptr, nullptr) <= 0) {
        LOG_WARN(TAG, "%s", "Overrides document is not valid JSON");
        return -1;
    }

    struct StringField { const char* path; char* dst; std::size_t cap; };
    const StringField strings[] = {
        {"$.wifi.ssid",      wifi_ssid,     sizeof(wifi_ssid)},
        {"$.wifi.password",  wifi_password, sizeof(wifi_password)},
        {"$.mqtt.host",      mqtt_host,     sizeof(mqtt_host)},
        {"$.mqtt.client_id", client_id,     sizeof(client_id)},
        {"$.mqtt.prefix",    topic_prefix,  sizeof(topic_prefix)},
    };
    struct NumberField { const char* path; uint32_t* dst; };
    const NumberField numbers[] = {
        {"$.wifi.association_timeout_ms", &association_timeout_ms},
        {"$.wifi.lease_timeout_ms",       &lease_timeout_ms},
        {"$.wifi.backoff_ms",             &reconnect_backoff_ms},
        {"$.mqtt.port",                   &mqtt_port},
        {"$.mqtt.connect_timeout_ms",     &connect_timeout_ms},
        {"$.mqtt.connack_timeout_ms",     &connack_timeout_ms},
        {"$.mqtt.write_timeout_ms",       &write_timeout_ms},
        {"$.cadence.measurement_ms",      &measurement_period_ms},
        {"$.cadence.heartbeat_ms",        &heartbeat_period_ms},
        {"$.cadence.status_ms",           &status_period_ms},
        {"$.cadence.tolerance_ms",        &cadence_tolerance_ms},
    };

    int applied = 0;
    for (const StringField& f : strings) {
        int rc = readString(json, len, f.path, f.dst, f.cap, truncated);
        if (rc < 0) {
            return -1;
        }
        applied += rc;
    }
    for (const NumberField& f : numbers) {
        int rc = readU32(json, len, f.path, *f.dst);
        if (rc < 0) {
            return -1;
        }
        applied += rc;
    }

    uint32_t keepalive = keepalive_seconds;
    int rc = readU32(json, len, "$.mqtt.keepalive_s", keepalive);
    if (rc < 0 || keepalive > 0xFFFF) {
        return -1;
    }
    keepalive_seconds = static_cast<uint16_t>(keepalive);
    applied += rc;

    LOG_INFO(TAG, "Applied %d override(s)", applied);
    return applied;
}

bool PipelineSettings::validate() const {
    if (truncated) {
        LOG_ERROR(TAG, "%s", "A string setting exceeded its maximum length");
        return false;
    }
    bool ok = true;
    ok &= lengthOk("wifi ssid", wifi_ssid, 1, SETTINGS_SSID_MAX_LEN);
    ok &= lengthOk("wifi password", wifi_password, 0, SETTINGS_PASSWORD_MAX_LEN);
    ok &= lengthOk("mqtt host", mqtt_host, 1, SETTINGS_HOST_MAX_LEN);
    // Broker is addressed by IPv4 literal; no DNS lookup on the publish path
    in_addr broker_addr;
    if (mqtt_host[0] != '\0' && inet_pton(AF_INET, mqtt_host, &broker_addr) != 1) {
        LOG_ERROR(TAG, "mqtt host '%s' is not an IPv4 address", mqtt_host);
        ok = false;
    }
    ok &= lengthOk("client id", client_id, 1, SETTINGS_CLIENT_ID_MAX_LEN);
    ok &= lengthOk("topic prefix", topic_prefix, 1, SETTINGS_PREFIX_MAX_LEN);

    if (mqtt_port == 0 || mqtt_port > 65535) {
        LOG_ERROR(TAG, "mqtt port %lu outside 1..65535", static_cast<unsigned long>(mqtt_port));
        ok = false;
    }
    if (measurement_period_ms == 0 || heartbeat_period_ms == 0 || status_period_ms == 0) {
        LOG_ERROR(TAG, "%s", "Cadence intervals must be non-zero");
        ok = false;
    } else if (heartbeat_period_ms != 2 * measurement_period_ms ||
               status_period_ms != 4 * measurement_period_ms) {
        LOG_ERROR(TAG, "Cadences %lu/%lu/%lu ms are not in 1:2:4 ratio",
                  static_cast<unsigned long>(measurement_period_ms),
                  static_cast<unsigned long>(heartbeat_period_ms),
                  static_cast<unsigned long>(status_period_ms));
        ok = false;
    }
    if (association_timeout_ms == 0 || lease_timeout_ms == 0 ||
        connect_timeout_ms == 0 || connack_timeout_ms == 0 || write_timeout_ms == 0) {
        LOG_ERROR(TAG, "%s", "Timeouts must be non-zero");
        ok = false;
    }
    return ok;
}
