#include <main/tasks/telemetry_scheduler.hpp>
#include <main/network/telemetry_payloads.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "SCHEDULER";

const char* toString(Cadence cadence) {
    switch (cadence) {
        case Cadence::MEASUREMENT: return "measurement";
        case Cadence::HEARTBEAT:   return "heartbeat";
        case Cadence::STATUS:      return "status";
        default:                   return "unknown";
    }
}

namespace {
    static std::size_t indexOf(Cadence cadence) {
        return static_cast<std::size_t>(cadence);
    }
}

TelemetryScheduler::TelemetryScheduler(Bme280Sensor& sensor_in,
                                       ConnectivityManager& connectivity_in,
                                       const CadencePublishers& publishers_in,
                                       SystemInfo& system_in,
                                       const PipelineSettings& settings_in,
                                       Lock& lock_in)
    : sensor(sensor_in),
      connectivity(connectivity_in),
      publishers{&publishers_in.measurement, &publishers_in.heartbeat, &publishers_in.status},
      system(system_in),
      settings(settings_in),
      timers{CadenceTimer(settings_in.measurement_period_ms),
             CadenceTimer(settings_in.heartbeat_period_ms),
             CadenceTimer(settings_in.status_period_ms)},
      state_lock(lock_in),
      trackers{CadenceTracker(settings_in.measurement_period_ms, settings_in.cadence_tolerance_ms),
               CadenceTracker(settings_in.heartbeat_period_ms, settings_in.cadence_tolerance_ms),
               CadenceTracker(settings_in.status_period_ms, settings_in.cadence_tolerance_ms)},
      last_measurement{},
      has_measurement(false),
      reading_sequence(0),
      heartbeat_sequence(0),
      network_only(false) {}

TelemetryScheduler::TelemetryScheduler(Bme280Sensor& sensor_in,
                                       ConnectivityManager& connectivity_in,
                                       TelemetryPublisher& shared_publisher,
                                       SystemInfo& system_in,
                                       const PipelineSettings& settings_in,
                                       Lock& lock_in)
    : TelemetryScheduler(sensor_in, connectivity_in,
                         CadencePublishers{shared_publisher, shared_publisher, shared_publisher},
                         system_in, settings_in, lock_in) {}

void TelemetryScheduler::start(uint32_t now_ms, SensorError sensor_init) {
    for (CadenceTimer& timer : timers) {
        timer.start(now_ms);
    }
    LockGuard guard(state_lock);
    network_only = (sensor_init == SensorError::NOT_FOUND);
    if (network_only) {
        LOG_WARN(TAG, "%s", "No sensor found, running network-only (heartbeat and status)");
    } else if (sensor_init != SensorError::OK) {
        LOG_WARN(TAG, "Sensor init failed (%s), will retry on measurement ticks", toString(sensor_init));
    }
    LOG_INFO(TAG, "Cadences %lu/%lu/%lu ms, tolerance %lu ms",
             static_cast<unsigned long>(settings.measurement_period_ms),
             static_cast<unsigned long>(settings.heartbeat_period_ms),
             static_cast<unsigned long>(settings.status_period_ms),
             static_cast<unsigned long>(settings.cadence_tolerance_ms));
}

void TelemetryScheduler::recordTick(Cadence cadence, uint32_t now_ms) {
    LockGuard guard(state_lock);
    CadenceTracker& tracker = trackers[indexOf(cadence)];
    const uint32_t previous_ms = tracker.stats().last_tick_ms;
    if (!tracker.record(now_ms)) {
        LOG_WARN(TAG, "%s tick off schedule: %lu ms since previous (nominal %lu)",
                 toString(cadence),
                 static_cast<unsigned long>(now_ms - previous_ms),
                 static_cast<unsigned long>(timers[indexOf(cadence)].interval()));
    }
}

bool TelemetryScheduler::publishIfConnected(Cadence cadence, const TelemetryMessage& message) {
    if (!connectivity.isConnected()) {
        LOG_DEBUG(TAG, "Not connected, skipping %s publish", toString(cadence));
        return false;
    }
    PublishCycleResult result = publishers[indexOf(cadence)]->publish(message);
    if (!result.success) {
        LOG_WARN(TAG, "%s publish failed: %s", toString(cadence), toString(result.error));
    }
    return result.success;
}

void TelemetryScheduler::runMeasurementTick(uint32_t now_ms) {
    recordTick(Cadence::MEASUREMENT, now_ms);
    if (isNetworkOnly()) {
        return;
    }

    if (!sensor.isInitialized()) {
        SensorError init_err = sensor.init();
        if (init_err != SensorError::OK) {
            LOG_WARN(TAG, "Sensor still unavailable: %s", toString(init_err));
            return;
        }
    }

    Measurement m{};
    SensorError err = sensor.readMeasurement(m);
    if (err != SensorError::OK) {
        LOG_WARN(TAG, "Measurement failed: %s", toString(err));
        return;
    }
    m.ts_ms = now_ms;
    {
        LockGuard guard(state_lock);
        m.sequence = ++reading_sequence;
        last_measurement = m;
        has_measurement = true;
    }
    if (m.has_humidity) {
        LOG_INFO(TAG, "Reading #%lu: %.2f C, %.1f %%RH, %.1f hPa", static_cast<unsigned long>(m.sequence),
                 static_cast<double>(m.temperature_c), static_cast<double>(m.humidity_pct),
                 static_cast<double>(m.pressure_hpa));
    } else {
        LOG_INFO(TAG, "Reading #%lu: %.2f C, %.1f hPa", static_cast<unsigned long>(m.sequence),
                 static_cast<double>(m.temperature_c), static_cast<double>(m.pressure_hpa));
    }

    TelemetryMessage msg{};
    if (!TelemetryPayloads::buildSensor(settings.topic_prefix, sensor.sensorTypeName(), m, msg)) {
        LOG_ERROR(TAG, "%s", "Sensor message does not fit");
        return;
    }
    publishIfConnected(Cadence::MEASUREMENT, msg);
}

void TelemetryScheduler::runHeartbeatTick(uint32_t now_ms) {
    recordTick(Cadence::HEARTBEAT, now_ms);
    if (!connectivity.isConnected()) {
        LOG_DEBUG(TAG, "%s", "Not connected, skipping heartbeat");
        return;
    }
    uint32_t sequence;
    {
        LockGuard guard(state_lock);
        sequence = ++heartbeat_sequence;
    }
    TelemetryMessage msg{};
    if (!TelemetryPayloads::buildHeartbeat(settings.topic_prefix, sequence, msg)) {
        LOG_ERROR(TAG, "%s", "Heartbeat message does not fit");
        return;
    }
    publishIfConnected(Cadence::HEARTBEAT, msg);
}

void TelemetryScheduler::runStatusTick(uint32_t now_ms) {
    recordTick(Cadence::STATUS, now_ms);
    if (!connectivity.isConnected()) {
        LOG_DEBUG(TAG, "%s", "Not connected, skipping status");
        return;
    }
    DeviceHealth health;
    health.uptime_s = system.uptimeSeconds();
    health.free_heap_bytes = system.freeHeapBytes();
    health.wifi_rssi_dbm = connectivity.rssi();
    health.connected = true;

    TelemetryMessage msg{};
    if (!TelemetryPayloads::buildStatus(settings.topic_prefix, health, msg)) {
        LOG_ERROR(TAG, "%s", "Status message does not fit");
        return;
    }
    publishIfConnected(Cadence::STATUS, msg);
}

uint32_t TelemetryScheduler::poll(uint32_t now_ms) {
    if (timers[indexOf(Cadence::MEASUREMENT)].isDue(now_ms)) {
        runMeasurementTick(now_ms);
        uint32_t skipped = timers[indexOf(Cadence::MEASUREMENT)].advance(now_ms);
        if (skipped > 0) {
            LOG_WARN(TAG, "measurement skipped %lu slot(s), next at %lu ms", static_cast<unsigned long>(skipped),
                     static_cast<unsigned long>(timers[indexOf(Cadence::MEASUREMENT)].nextDue()));
        }
    }
    if (timers[indexOf(Cadence::HEARTBEAT)].isDue(now_ms)) {
        runHeartbeatTick(now_ms);
        uint32_t skipped = timers[indexOf(Cadence::HEARTBEAT)].advance(now_ms);
        if (skipped > 0) {
            LOG_WARN(TAG, "heartbeat skipped %lu slot(s), next at %lu ms", static_cast<unsigned long>(skipped),
                     static_cast<unsigned long>(timers[indexOf(Cadence::HEARTBEAT)].nextDue()));
        }
    }
    if (timers[indexOf(Cadence::STATUS)].isDue(now_ms)) {
        runStatusTick(now_ms);
        uint32_t skipped = timers[indexOf(Cadence::STATUS)].advance(now_ms);
        if (skipped > 0) {
            LOG_WARN(TAG, "status skipped %lu slot(s), next at %lu ms", static_cast<unsigned long>(skipped),
                     static_cast<unsigned long>(timers[indexOf(Cadence::STATUS)].nextDue()));
        }
    }

    uint32_t wait = timers[0].remaining(now_ms);
    for (const CadenceTimer& timer : timers) {
        uint32_t r = timer.remaining(now_ms);
        if (r < wait) {
            wait = r;
        }
    }
    return wait;
}

bool TelemetryScheduler::lastMeasurement(Measurement& out) const {
    LockGuard guard(state_lock);
    if (!has_measurement) {
        return false;
    }
    out = last_measurement;
    return true;
}

PublishCounters TelemetryScheduler::publishCounters() const {
    PublishCounters total{};
    for (std::size_t i = 0; i < 3; ++i) {
        bool seen = false;
        for (std::size_t j = 0; j < i; ++j) {
            seen = seen || (publishers[j] == publishers[i]);
        }
        if (seen) {
            continue;
        }
        PublishCounters c = publishers[i]->counters();
        total.success += c.success;
        total.failure += c.failure;
    }
    return total;
}

CadenceStats TelemetryScheduler::cadenceStats(Cadence cadence) const {
    LockGuard guard(state_lock);
    return trackers[indexOf(cadence)].stats();
}

uint32_t TelemetryScheduler::readingSequence() const {
    LockGuard guard(state_lock);
    return reading_sequence;
}

uint32_t TelemetryScheduler::heartbeatSequence() const {
    LockGuard guard(state_lock);
    return heartbeat_sequence;
}

bool TelemetryScheduler::isNetworkOnly() const {
    LockGuard guard(state_lock);
    return network_only;
}
