#ifndef PIPELINE_SETTINGS_HPP
#define PIPELINE_SETTINGS_HPP

#include <cstddef>
#include <cstdint>

// Field limits, excluding the terminator
static constexpr std::size_t SETTINGS_SSID_MAX_LEN = 32;
static constexpr std::size_t SETTINGS_PASSWORD_MAX_LEN = 64;
static constexpr std::size_t SETTINGS_HOST_MAX_LEN = 63;
static constexpr std::size_t SETTINGS_CLIENT_ID_MAX_LEN = 23;
static constexpr std::size_t SETTINGS_PREFIX_MAX_LEN = 32;

// Runtime values handed to the pipeline by the configuration collaborator.
// Starts from the Config:: compile-time defaults; a JSON overrides document
// can replace any subset of fields before validate().
struct PipelineSettings {
    // Wi-Fi link
    char     wifi_ssid[SETTINGS_SSID_MAX_LEN + 1];
    char     wifi_password[SETTINGS_PASSWORD_MAX_LEN + 1];
    uint32_t association_timeout_ms;
    uint32_t lease_timeout_ms;
    uint32_t reconnect_backoff_ms;

    // Broker
    char     mqtt_host[SETTINGS_HOST_MAX_LEN + 1];
    uint32_t mqtt_port; // wide so an out-of-range override is caught by validate()
    char     client_id[SETTINGS_CLIENT_ID_MAX_LEN + 1];
    char     topic_prefix[SETTINGS_PREFIX_MAX_LEN + 1];
    uint16_t keepalive_seconds;
    uint32_t connect_timeout_ms;
    uint32_t connack_timeout_ms;
    uint32_t write_timeout_ms;

    // Cadences
    uint32_t measurement_period_ms;
    uint32_t heartbeat_period_ms;
    uint32_t status_period_ms;
    uint32_t cadence_tolerance_ms;

    // Set when a string value did not fit its field; validate() rejects it
    bool     truncated;

    static PipelineSettings defaults();

    // Applies the keys present in a JSON object, e.g.
    // {"wifi":{"ssid":"lab"},"mqtt":{"host":"10.0.0.5","port":1884},
    //  "cadence":{"measurement_ms":15000,"heartbeat_ms":30000,"status_ms":60000}}
    // Returns the number of fields applied, -1 if a present key has the wrong type.
    int applyJson(const char* json, int len);

    bool validate() const;
};

#endif // PIPELINE_SETTINGS_HPP
