#ifndef TELEMETRY_SCHEDULER_HPP
#define TELEMETRY_SCHEDULER_HPP

#include <cstdint>
#include <main/hardware/bme280_sensor.hpp>
#include <main/models/cadence_stats.hpp>
#include <main/models/measurement.hpp>
#include <main/models/publish_counters.hpp>
#include <main/network/connectivity_manager.hpp>
#include <main/network/telemetry_publisher.hpp>
#include <main/state/pipeline_settings.hpp>
#include <main/utils/cadence_timer.hpp>
#include <main/utils/lock.hpp>
#include <main/utils/system_info.hpp>

enum class Cadence : uint8_t {
    MEASUREMENT = 0,
    HEARTBEAT,
    STATUS
};

const char* toString(Cadence cadence);

// Cadence tasks publish concurrently, so each needs its own publisher
struct CadencePublishers {
    TelemetryPublisher& measurement;
    TelemetryPublisher& heartbeat;
    TelemetryPublisher& status;
};

// Three independent cadences over the sensor, connectivity and publisher:
//   measurement (30 s)  read sensor, publish <prefix>/sensor/<type>
//   heartbeat   (60 s)  publish <prefix>/heartbeat
//   status      (120 s) publish <prefix>/status
// Ticks are skipped, not queued, while the link is down.
//
// On the device each cadence runs in its own task calling run*Tick() with
// its own publisher; host code drives all three through poll(), which runs
// them one after another and may share a single publisher.
class TelemetryScheduler {
public:
    TelemetryScheduler(Bme280Sensor& sensor,
                       ConnectivityManager& connectivity,
                       const CadencePublishers& publishers,
                       SystemInfo& system,
                       const PipelineSettings& settings,
                       Lock& state_lock);

    TelemetryScheduler(Bme280Sensor& sensor,
                       ConnectivityManager& connectivity,
                       TelemetryPublisher& shared_publisher,
                       SystemInfo& system,
                       const PipelineSettings& settings,
                       Lock& state_lock);

    // Anchor every cadence grid at now_ms. sensor_init is the result of
    // Bme280Sensor::init(); NOT_FOUND switches to network-only mode.
    void start(uint32_t now_ms, SensorError sensor_init);

    void runMeasurementTick(uint32_t now_ms);
    void runHeartbeatTick(uint32_t now_ms);
    void runStatusTick(uint32_t now_ms);

    // Runs every due cadence in measurement, heartbeat, status order.
    // Returns milliseconds until the next cadence is due.
    uint32_t poll(uint32_t now_ms);

    // Read-only views for collaborators
    bool lastMeasurement(Measurement& out) const;
    // Summed over the distinct publishers
    PublishCounters publishCounters() const;
    CadenceStats cadenceStats(Cadence cadence) const;
    uint32_t readingSequence() const;
    uint32_t heartbeatSequence() const;
    bool isNetworkOnly() const;

private:
    bool publishIfConnected(Cadence cadence, const TelemetryMessage& message);
    void recordTick(Cadence cadence, uint32_t now_ms);

    Bme280Sensor& sensor;
    ConnectivityManager& connectivity;
    TelemetryPublisher* publishers[3];
    SystemInfo& system;
    const PipelineSettings& settings;

    // poll() only
    CadenceTimer timers[3];

    Lock& state_lock; // guards everything below
    CadenceTracker trackers[3];
    Measurement last_measurement;
    bool has_measurement;
    uint32_t reading_sequence;
    uint32_t heartbeat_sequence;
    bool network_only;
};

#endif // TELEMETRY_SCHEDULER_HPP
