#ifndef ESP_SYSTEM_INFO_HPP
#define ESP_SYSTEM_INFO_HPP

#include <main/utils/system_info.hpp>

// esp_timer and heap_caps backed clock and health source
class EspSystemInfo : public Clock, public SystemInfo {
public:
    uint32_t nowMs() override;
    uint32_t uptimeSeconds() override;
    uint32_t freeHeapBytes() override;
};

#endif // ESP_SYSTEM_INFO_HPP
