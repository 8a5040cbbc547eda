#ifndef PUBLISH_COUNTERS_HPP
#define PUBLISH_COUNTERS_HPP

#include <cstdint>

// Cumulative publish outcomes since boot
struct PublishCounters {
    uint32_t success;
    uint32_t failure;
};

#endif // PUBLISH_COUNTERS_HPP
