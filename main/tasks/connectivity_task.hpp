#ifndef CONNECTIVITY_TASK_HPP
#define CONNECTIVITY_TASK_HPP

#include <main/network/connectivity_manager.hpp>
#include <main/utils/system_info.hpp>

namespace ConnectivityTask {
    // Creates a static FreeRTOS task that starts the connectivity manager and
    // polls it every Config::Tasks::Connectivity::poll_period_ms.
    void create(ConnectivityManager& connectivity, Clock& clock);
}

#endif // CONNECTIVITY_TASK_HPP
