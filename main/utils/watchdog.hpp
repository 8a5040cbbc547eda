#ifndef WATCHDOG_HPP
#define WATCHDOG_HPP

#include <cstdint>

// Task watchdog (esp_task_wdt) for the pipeline tasks. The timeout must cover
// the longest blocking step of a tick: one full publish exchange.
namespace Watchdog {
    // Call once from app_main before tasks start
    bool init(uint32_t timeout_ms);
    // Subscribe the calling task
    void subscribe();
    void feed();
}

#endif // WATCHDOG_HPP
