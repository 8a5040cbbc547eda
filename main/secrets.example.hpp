// Copy to secrets.hpp (git-ignored) and fill in real values.
#ifndef SECRETS_HPP
#define SECRETS_HPP

namespace Secrets {
    static constexpr const char* WIFI_SSID = "your-ssid";
    static constexpr const char* WIFI_PASSWORD = "your-password";
    static constexpr const char* DEVICE_ID = "envmon-01";
    static constexpr const char* MQTT_HOST = "192.168.1.100";
    static constexpr int MQTT_PORT = 1883;
    static constexpr const char* TOPIC_PREFIX = "envmon";
}

#endif // SECRETS_HPP
