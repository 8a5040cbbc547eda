#ifndef CADENCE_STATS_HPP
#define CADENCE_STATS_HPP

#include <cstdint>

// Observed inter-tick intervals of one cadence. Intervals are only known from
// the second tick on, so min/max stay 0 until then.
struct CadenceStats {
    uint32_t ticks;
    uint32_t last_tick_ms;
    uint32_t min_interval_ms;
    uint32_t max_interval_ms;
    uint32_t out_of_tolerance;
};

#endif // CADENCE_STATS_HPP
