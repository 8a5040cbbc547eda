#include <main/tasks/telemetry_tasks.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <main/utils/cadence_timer.hpp>
#include <main/utils/watchdog.hpp>

namespace {
    static const char* TAG = "TELEMETRY_TASKS";

    // Longest single sleep, so the watchdog is fed through 30-120 s periods
    static constexpr uint32_t MAX_SLEEP_SLICE_MS = 1000;
    static constexpr uint32_t STACK_BYTES = 6144;

    struct CadenceTaskContext {
        Cadence cadence;
        uint32_t period_ms;
        StaticTask_t tcb;
        StackType_t stack[STACK_BYTES / sizeof(StackType_t)];
    };

    static CadenceTaskContext s_contexts[3];
    static TelemetryScheduler* s_scheduler = nullptr;
    static Clock* s_clock = nullptr;

    static void runTick(Cadence cadence, uint32_t now_ms) {
        switch (cadence) {
            case Cadence::MEASUREMENT: s_scheduler->runMeasurementTick(now_ms); break;
            case Cadence::HEARTBEAT:   s_scheduler->runHeartbeatTick(now_ms); break;
            case Cadence::STATUS:      s_scheduler->runStatusTick(now_ms); break;
        }
    }

    static void taskFunction(void* arg) {
        CadenceTaskContext* ctx = static_cast<CadenceTaskContext*>(arg);
        LOG_INFO(TAG, "%s task started (%lu ms)", toString(ctx->cadence), static_cast<unsigned long>(ctx->period_ms));
        Watchdog::subscribe();

        CadenceTimer timer(ctx->period_ms);
        timer.start(s_clock->nowMs());

        for (;;) {
            Watchdog::feed();
            uint32_t now_ms = s_clock->nowMs();
            if (!timer.isDue(now_ms)) {
                uint32_t wait_ms = timer.remaining(now_ms);
                vTaskDelay(pdMS_TO_TICKS(wait_ms < MAX_SLEEP_SLICE_MS ? wait_ms : MAX_SLEEP_SLICE_MS));
                continue;
            }

            runTick(ctx->cadence, now_ms);

            uint32_t skipped = timer.advance(s_clock->nowMs());
            if (skipped > 0) {
                LOG_WARN(TAG, "%s overran, skipped %lu slot(s), next at %lu ms", toString(ctx->cadence),
                         static_cast<unsigned long>(skipped), static_cast<unsigned long>(timer.nextDue()));
            }
        }
    }

    static void createOne(std::size_t index, Cadence cadence, uint32_t period_ms, const char* name) {
        CadenceTaskContext& ctx = s_contexts[index];
        ctx.cadence = cadence;
        ctx.period_ms = period_ms;
        xTaskCreateStaticPinnedToCore(taskFunction, name,
                                      sizeof(ctx.stack) / sizeof(StackType_t), &ctx,
                                      tskIDLE_PRIORITY + Config::TaskPriorities::PIPELINE,
                                      ctx.stack, &ctx.tcb, Config::TaskPriorities::pipeline_core);
    }
}

namespace TelemetryTasks {
    void create(TelemetryScheduler& scheduler, const PipelineSettings& settings, Clock& clock) {
        s_scheduler = &scheduler;
        s_clock = &clock;
        if (Config::Features::enable_measurement) {
            createOne(0, Cadence::MEASUREMENT, settings.measurement_period_ms, "measurement");
        }
        if (Config::Features::enable_heartbeat) {
            createOne(1, Cadence::HEARTBEAT, settings.heartbeat_period_ms, "heartbeat");
        }
        if (Config::Features::enable_status) {
            createOne(2, Cadence::STATUS, settings.status_period_ms, "status");
        }
    }
}
