#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <main/utils/logger.hpp>
#include <main/utils/esp_log_sink.hpp>
#include <main/utils/esp_system_info.hpp>
#include <main/utils/watchdog.hpp>
#include <main/utils/freertos_lock.hpp>
#include <main/config/config.hpp>
#include <main/state/pipeline_settings.hpp>
#include <main/hardware/esp_i2c_bus.hpp>
#include <main/hardware/bme280_sensor.hpp>
#include <main/network/esp_wifi_radio.hpp>
#include <main/network/socket_transport.hpp>
#include <main/network/connectivity_manager.hpp>
#include <main/network/telemetry_publisher.hpp>
#include <main/tasks/telemetry_scheduler.hpp>
#include <main/tasks/connectivity_task.hpp>
#include <main/tasks/telemetry_tasks.hpp>
#include <nvs_flash.h>
#include <nvs.h>

static const char* TAG = "MAIN";
static const char* NVS_NAMESPACE = "envmon";
static const char* NVS_OVERRIDES_KEY = "overrides";

// Overrides document written by the configuration collaborator, if any
static int loadOverrides(char* buf, std::size_t cap) {
    nvs_handle_t handle;
    esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READONLY, &handle);
    if (err != ESP_OK) {
        return 0;
    }
    std::size_t len = cap;
    err = nvs_get_str(handle, NVS_OVERRIDES_KEY, buf, &len);
    nvs_close(handle);
    if (err != ESP_OK) {
        if (err != ESP_ERR_NVS_NOT_FOUND) {
            LOG_WARN(TAG, "Reading settings overrides failed: %d", static_cast<int>(err));
        }
        return 0;
    }
    // len includes the terminator
    return len > 0 ? static_cast<int>(len - 1) : 0;
}

extern "C" void app_main(void)
{
    EspLogSink::install();
    Logger::setLevel(LogLevel::INFO);
    LOG_INFO(TAG, "%s", "---Environmental monitor started---");

    // NVS is required by the Wi-Fi driver
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        err = nvs_flash_init();
    }
    ESP_ERROR_CHECK(err);

    // Settings: compile-time defaults plus optional overrides
    static PipelineSettings settings = PipelineSettings::defaults();
    static char overrides[512];
    int overrides_len = loadOverrides(overrides, sizeof(overrides));
    if (overrides_len > 0) {
        PipelineSettings candidate = settings;
        if (candidate.applyJson(overrides, overrides_len) >= 0 && candidate.validate()) {
            settings = candidate;
        } else {
            LOG_WARN(TAG, "%s", "Ignoring invalid settings overrides, using defaults");
        }
    }
    if (!settings.validate()) {
        LOG_ERROR(TAG, "%s", "Default settings invalid; check secrets.hpp");
        for (;;) {
            vTaskDelay(portMAX_DELAY);
        }
    }

    if (!Watchdog::init(Config::Tasks::watchdog_timeout_ms)) {
        LOG_WARN(TAG, "%s", "Task watchdog unavailable; pipeline tasks run unsupervised");
    }

    static EspSystemInfo system_info;

    // Sensor
    static EspI2cBus bus(static_cast<i2c_port_t>(Config::Hardware::Sensor::i2c_port),
                         static_cast<gpio_num_t>(Config::Hardware::Sensor::sda_gpio),
                         static_cast<gpio_num_t>(Config::Hardware::Sensor::scl_gpio),
                         Config::Hardware::Sensor::clk_hz,
                         Config::Hardware::Sensor::bus_timeout_ms);
    static Bme280Sensor sensor(bus);
    SensorError sensor_err = SensorError::COMMUNICATION_TIMEOUT;
    if (bus.init()) {
        sensor_err = sensor.init();
    } else {
        LOG_ERROR(TAG, "%s", "I2C bus init failed; sensor init will be retried");
    }

    // Network
    static EspWifiRadio radio;
    if (!radio.init()) {
        LOG_ERROR(TAG, "%s", "Wi-Fi init failed");
    }
    static FreeRtosLock connectivity_lock;
    static ConnectivityManager connectivity(radio, settings, connectivity_lock);

    // One connection path per cadence task
    static SocketTransport measurement_transport;
    static SocketTransport heartbeat_transport;
    static SocketTransport status_transport;
    static TelemetryPublisher measurement_publisher(measurement_transport, settings);
    static TelemetryPublisher heartbeat_publisher(heartbeat_transport, settings);
    static TelemetryPublisher status_publisher(status_transport, settings);

    static FreeRtosLock scheduler_lock;
    static TelemetryScheduler scheduler(sensor, connectivity,
                                        CadencePublishers{measurement_publisher, heartbeat_publisher, status_publisher},
                                        system_info, settings, scheduler_lock);
    scheduler.start(system_info.nowMs(), sensor_err);

    ConnectivityTask::create(connectivity, system_info);
    TelemetryTasks::create(scheduler, settings, system_info);

    // Main task has nothing to do after initialization - block forever
    for (;;) {
        vTaskDelay(portMAX_DELAY);
    }
}
