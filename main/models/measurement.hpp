#ifndef MEASUREMENT_HPP
#define MEASUREMENT_HPP

#include <cstdint>

// One compensated sensor sample
struct Measurement {
    float    temperature_c; // -40..85
    float    pressure_hpa;  // 300..1100
    float    humidity_pct;  // 0..100, meaningful only when has_humidity
    bool     has_humidity;  // false on BMP280
    uint32_t sequence;      // reading counter, assigned by the scheduler
    uint32_t ts_ms;         // sample timestamp in milliseconds
};

#endif // MEASUREMENT_HPP
