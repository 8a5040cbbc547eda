#include <main/tasks/connectivity_task.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <main/utils/logger.hpp>
#include <main/config/config.hpp>
#include <main/utils/watchdog.hpp>

namespace {
    static const char* TAG = "CONN_TASK";

    // Static task resources
    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[4096 / sizeof(StackType_t)];

    static ConnectivityManager* s_connectivity = nullptr;
    static Clock* s_clock = nullptr;

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Connectivity Task started");
        Watchdog::subscribe();
        s_connectivity->start();

        TickType_t last_wake = xTaskGetTickCount();
        const TickType_t period = pdMS_TO_TICKS(Config::Tasks::Connectivity::poll_period_ms);
        LinkState last_kind = LinkState::IDLE;

        for (;;) {
            Watchdog::feed();
            s_connectivity->poll(s_clock->nowMs());

            LinkState kind = s_connectivity->state().kind;
            if (kind != last_kind) {
                LOG_DEBUG(TAG, "%s -> %s", toString(last_kind), toString(kind));
                last_kind = kind;
            }
            vTaskDelayUntil(&last_wake, period);
        }
    }
}

namespace ConnectivityTask {
    void create(ConnectivityManager& connectivity, Clock& clock) {
        s_connectivity = &connectivity;
        s_clock = &clock;
        xTaskCreateStaticPinnedToCore(taskFunction, "connectivity",
                                      sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                                      tskIDLE_PRIORITY + Config::TaskPriorities::PIPELINE,
                                      s_task_stack, &s_task_tcb, Config::TaskPriorities::pipeline_core);
    }
}
