#ifndef DEVICE_HEALTH_HPP
#define DEVICE_HEALTH_HPP

#include <cstdint>

// Snapshot published on the status cadence
struct DeviceHealth {
    uint32_t uptime_s;
    uint32_t free_heap_bytes;
    int8_t   wifi_rssi_dbm;
    bool     connected;
};

#endif // DEVICE_HEALTH_HPP
