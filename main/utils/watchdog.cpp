#include <main/utils/watchdog.hpp>
#include <main/utils/logger.hpp>
#include <esp_task_wdt.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace {
    static const char* TAG = "WATCHDOG";
}

namespace Watchdog {
    bool init(uint32_t timeout_ms) {
        esp_task_wdt_config_t config = {
            .timeout_ms = timeout_ms,
            .idle_core_mask = 0,  // Pipeline tasks only, not the idle tasks
            .trigger_panic = true
        };
        esp_err_t err = esp_task_wdt_reconfigure(&config);
        if (err == ESP_ERR_INVALID_STATE) {
            // Not started by the bootloader config
            err = esp_task_wdt_init(&config);
        }
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "TWDT config failed: %d", static_cast<int>(err));
            return false;
        }
        LOG_INFO(TAG, "TWDT configured: %lu ms timeout", static_cast<unsigned long>(timeout_ms));
        return true;
    }

    void subscribe() {
        esp_err_t err = esp_task_wdt_add(nullptr);
        if (err != ESP_OK) {
            LOG_WARN(TAG, "TWDT subscribe failed for %s: %d", pcTaskGetName(nullptr), static_cast<int>(err));
        }
    }

    void feed() {
        esp_err_t err = esp_task_wdt_reset();
        if (err != ESP_OK) {
            LOG_DEBUG(TAG, "TWDT reset failed: %d", static_cast<int>(err));
        }
    }
}
