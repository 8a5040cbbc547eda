#include <main/utils/freertos_lock.hpp>

FreeRtosLock::FreeRtosLock()
    : buffer{},
      handle(nullptr) {
    handle = xSemaphoreCreateMutexStatic(&buffer);
}

void FreeRtosLock::lock() {
    xSemaphoreTake(handle, portMAX_DELAY);
}

void FreeRtosLock::unlock() {
    xSemaphoreGive(handle);
}
