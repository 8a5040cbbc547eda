#ifndef TELEMETRY_TASKS_HPP
#define TELEMETRY_TASKS_HPP

#include <main/tasks/telemetry_scheduler.hpp>
#include <main/utils/system_info.hpp>

namespace TelemetryTasks {
    // Creates one static FreeRTOS task per enabled cadence (Config::Features),
    // all at the same priority on the same core. Each task keeps its own grid
    // so a slow tick in one cadence does not move the others.
    void create(TelemetryScheduler& scheduler, const PipelineSettings& settings, Clock& clock);
}

#endif // TELEMETRY_TASKS_HPP
