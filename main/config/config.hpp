#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <main/secrets.hpp>

// Compile-time defaults. Runtime values live in PipelineSettings, which starts
// from these and may be overridden by the configuration collaborator.
namespace Config {
namespace Wifi {
    // Network credentials sourced from secrets.hpp (git-ignored)
    static constexpr const char* ssid = Secrets::WIFI_SSID;
    static constexpr const char* password = Secrets::WIFI_PASSWORD;

    // Behavior
    static constexpr uint32_t association_timeout_ms = 15000;
    static constexpr uint32_t lease_timeout_ms = 10000;
    static constexpr uint32_t reconnect_backoff_ms = 5000; // Fixed, not exponential
}

namespace Device {
    static constexpr const char* id = Secrets::DEVICE_ID;
}

namespace Hardware {
// BME280/BMP280 on the I2C master bus.
// Store as plain int to avoid pulling I2C headers into all translation units
namespace Sensor {
    static constexpr int i2c_port = 0; // I2C_NUM_0
    static constexpr int sda_gpio = 21;
    static constexpr int scl_gpio = 22;
    static constexpr uint32_t clk_hz = 100000; // 100 kHz
    static constexpr uint32_t bus_timeout_ms = 100;
    // Candidate 7-bit addresses, probed in order (SDO low, SDO high)
    static constexpr uint8_t primary_addr = 0x76;
    static constexpr uint8_t secondary_addr = 0x77;
}
}

namespace Tasks {
namespace Measurement {
    static constexpr uint32_t period_ms = 30000;
}
namespace Heartbeat {
    static constexpr uint32_t period_ms = 60000;
}
namespace Status {
    static constexpr uint32_t period_ms = 120000;
}
namespace Connectivity {
    static constexpr uint32_t poll_period_ms = 100;
}
    // Accepted deviation of an actual inter-tick interval from nominal
    static constexpr uint32_t cadence_tolerance_ms = 5000;
    // Covers a worst-case publish (connect + CONNACK + writes) plus a sensor read
    static constexpr uint32_t watchdog_timeout_ms = 30000;
}

// Feature toggles to enable/disable cadences at build time
namespace Features {
    static constexpr bool enable_measurement = true;
    static constexpr bool enable_heartbeat   = true;
    static constexpr bool enable_status      = true;
}

// Task priority offsets above tskIDLE_PRIORITY. All pipeline tasks share one
// priority and one core so only one of them runs at a time.
namespace TaskPriorities {
    static constexpr unsigned PIPELINE = 1;
    static constexpr int pipeline_core = 1;
}

namespace Mqtt {
    // Broker endpoint (from secrets)
    static constexpr const char* host = Secrets::MQTT_HOST;
    static constexpr int port = Secrets::MQTT_PORT;

    // Session behavior (one connection per publish, always clean)
    static constexpr uint16_t keepalive_seconds = 60;
    static constexpr uint32_t connect_timeout_ms = 3000;
    static constexpr uint32_t connack_timeout_ms = 2000;
    static constexpr uint32_t write_timeout_ms = 2000;

    // Topic templates (use with prefix via snprintf)
    static constexpr const char* topic_prefix = Secrets::TOPIC_PREFIX;
    namespace Topics {
        static constexpr const char* SENSOR = "%s/sensor/%s";
        static constexpr const char* HEARTBEAT = "%s/heartbeat";
        static constexpr const char* STATUS = "%s/status";
    }
}
}

#endif // CONFIG_HPP
