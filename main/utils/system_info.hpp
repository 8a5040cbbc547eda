#ifndef SYSTEM_INFO_HPP
#define SYSTEM_INFO_HPP

#include <cstdint>

// Monotonic millisecond time since boot. Wraps after ~49 days; compare with
// unsigned subtraction.
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint32_t nowMs() = 0;
};

class SystemInfo {
public:
    virtual ~SystemInfo() = default;
    virtual uint32_t uptimeSeconds() = 0;
    virtual uint32_t freeHeapBytes() = 0;
};

#endif // SYSTEM_INFO_HPP
