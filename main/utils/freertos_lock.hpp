#ifndef FREERTOS_LOCK_HPP
#define FREERTOS_LOCK_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <main/utils/lock.hpp>

// Statically allocated FreeRTOS mutex (priority inheritance, no heap)
class FreeRtosLock : public Lock {
public:
    FreeRtosLock();

    void lock() override;
    void unlock() override;

private:
    StaticSemaphore_t buffer;
    SemaphoreHandle_t handle;
};

#endif // FREERTOS_LOCK_HPP
