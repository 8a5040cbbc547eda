#include <main/utils/esp_log_sink.hpp>
#include <main/utils/logger.hpp>
#include <esp_log.h>

namespace {
    static void espSink(LogLevel level, const char* tag, const char* message) {
        switch (level) {
            case LogLevel::ERROR: ESP_LOGE(tag, "%s", message); break;
            case LogLevel::WARN:  ESP_LOGW(tag, "%s", message); break;
            case LogLevel::INFO:  ESP_LOGI(tag, "%s", message); break;
            case LogLevel::DEBUG: ESP_LOGD(tag, "%s", message); break;
            default:              ESP_LOGI(tag, "%s", message); break;
        }
    }
}

namespace EspLogSink {
    void install() {
        Logger::setSink(&espSink);
    }
}
