#ifndef CADENCE_TIMER_HPP
#define CADENCE_TIMER_HPP

#include <cstdint>
#include <main/models/cadence_stats.hpp>

// Periodic deadline on an absolute grid anchored at start(). Late ticks do
// not shift the grid and missed slots are dropped rather than replayed.
class CadenceTimer {
public:
    explicit CadenceTimer(uint32_t interval_ms);

    void start(uint32_t now_ms);
    bool isDue(uint32_t now_ms) const;
    // Move to the first grid slot after now_ms; returns the slots skipped
    uint32_t advance(uint32_t now_ms);
    // Milliseconds until the next slot, 0 if already due
    uint32_t remaining(uint32_t now_ms) const;

    uint32_t nextDue() const { return next_due_ms; }
    uint32_t interval() const { return interval_ms; }

private:
    uint32_t interval_ms;
    uint32_t next_due_ms;
};

// Records actual tick times against a nominal interval +/- tolerance
class CadenceTracker {
public:
    CadenceTracker(uint32_t nominal_ms, uint32_t tolerance_ms);

    // Returns false when the interval since the previous tick was out of tolerance
    bool record(uint32_t now_ms);
    const CadenceStats& stats() const { return s; }

private:
    uint32_t nominal_ms;
    uint32_t tolerance_ms;
    CadenceStats s;
};

#endif // CADENCE_TIMER_HPP
