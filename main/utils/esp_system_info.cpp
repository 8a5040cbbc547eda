#include <main/utils/esp_system_info.hpp>
#include <esp_timer.h>
#include <esp_system.h>

uint32_t EspSystemInfo::nowMs() {
    return static_cast<uint32_t>(esp_timer_get_time() / 1000);
}

uint32_t EspSystemInfo::uptimeSeconds() {
    return static_cast<uint32_t>(esp_timer_get_time() / 1000000);
}

uint32_t EspSystemInfo::freeHeapBytes() {
    return esp_get_free_heap_size();
}
