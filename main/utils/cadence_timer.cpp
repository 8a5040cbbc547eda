#include <main/utils/cadence_timer.hpp>

CadenceTimer::CadenceTimer(uint32_t interval)
    : interval_ms(interval), next_due_ms(0) {}

void CadenceTimer::start(uint32_t now_ms) {
    next_due_ms = now_ms + interval_ms;
}

bool CadenceTimer::isDue(uint32_t now_ms) const {
    // Signed distance tolerates wrap-around
    return static_cast<int32_t>(now_ms - next_due_ms) >= 0;
}

uint32_t CadenceTimer::advance(uint32_t now_ms) {
    uint32_t skipped = 0;
    next_due_ms += interval_ms;
    while (isDue(now_ms)) {
        next_due_ms += interval_ms;
        ++skipped;
    }
    return skipped;
}

uint32_t CadenceTimer::remaining(uint32_t now_ms) const {
    return isDue(now_ms) ? 0 : next_due_ms - now_ms;
}

CadenceTracker::CadenceTracker(uint32_t nominal, uint32_t tolerance)
    : nominal_ms(nominal), tolerance_ms(tolerance), s{0, 0, 0, 0, 0} {}

bool CadenceTracker::record(uint32_t now_ms) {
    bool in_tolerance = true;
    if (s.ticks > 0) {
        const uint32_t interval = now_ms - s.last_tick_ms;
        const uint32_t deviation = (interval > nominal_ms) ? interval - nominal_ms : nominal_ms - interval;
        if (deviation > tolerance_ms) {
            ++s.out_of_tolerance;
            in_tolerance = false;
        }
        if (s.ticks == 1 || interval < s.min_interval_ms) {
            s.min_interval_ms = interval;
        }
        if (interval > s.max_interval_ms) {
            s.max_interval_ms = interval;
        }
    }
    s.last_tick_ms = now_ms;
    ++s.ticks;
    return in_tolerance;
}
