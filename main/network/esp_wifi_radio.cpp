#include <main/network/esp_wifi_radio.hpp>
#include <main/utils/logger.hpp>

#include <esp_err.h>
#include <cstdio>

static const char* TAG = "WiFiRadio";

EspWifiRadio::EspWifiRadio()
    : initialized(false),
      sta_netif(nullptr),
      assoc_status(AssociationStatus::IDLE),
      got_ip(false),
      ip_addr(0),
      wifi_any_id_instance(nullptr),
      ip_any_id_instance(nullptr) {}

bool EspWifiRadio::init() {
    if (initialized) {
        return true;
    }

    // Netif and event loop
    ESP_ERROR_CHECK(esp_netif_init());
    esp_err_t loop_err = esp_event_loop_create_default();
    if (loop_err != ESP_OK && loop_err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR(TAG, "Event loop create failed: %d", static_cast<int>(loop_err));
        return false;
    }

    sta_netif = esp_netif_create_default_wifi_sta();

    wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
    ESP_ERROR_CHECK(esp_wifi_init(&cfg));

    ESP_ERROR_CHECK(esp_event_handler_instance_register(
        WIFI_EVENT,
        ESP_EVENT_ANY_ID,
        &EspWifiRadio::wifiEventHandler,
        this,
        &wifi_any_id_instance
    ));
    ESP_ERROR_CHECK(esp_event_handler_instance_register(
        IP_EVENT,
        ESP_EVENT_ANY_ID,
        &EspWifiRadio::ipEventHandler,
        this,
        &ip_any_id_instance
    ));

    ESP_ERROR_CHECK(esp_wifi_set_mode(WIFI_MODE_STA));
    ESP_ERROR_CHECK(esp_wifi_start());

    initialized = true;
    return true;
}

bool EspWifiRadio::beginAssociation(const char* ssid, const char* password) {
    if (!initialized) {
        return false;
    }
    got_ip = false;
    ip_addr = 0;

    wifi_config_t wifi_config = {};
    // IDF expects zero-terminated
    snprintf(reinterpret_cast<char*>(wifi_config.sta.ssid),
                  sizeof(wifi_config.sta.ssid), "%s", ssid);
    snprintf(reinterpret_cast<char*>(wifi_config.sta.password),
                  sizeof(wifi_config.sta.password), "%s", password);
    wifi_config.sta.threshold.authmode = (password[0] == '\0') ? WIFI_AUTH_OPEN : WIFI_AUTH_WPA2_PSK;
    wifi_config.sta.sae_pwe_h2e = WPA3_SAE_PWE_BOTH;
    wifi_config.sta.pmf_cfg.capable = true;
    wifi_config.sta.pmf_cfg.required = false;

    esp_err_t err = esp_wifi_set_config(WIFI_IF_STA, &wifi_config);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_set_config failed: %d", static_cast<int>(err));
        return false;
    }
    assoc_status = AssociationStatus::PENDING;
    err = esp_wifi_connect();
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_connect failed: %d", static_cast<int>(err));
        assoc_status = AssociationStatus::FAILED;
        return false;
    }
    return true;
}

AssociationStatus EspWifiRadio::associationStatus() {
    return assoc_status.load();
}

bool EspWifiRadio::requestLease() {
    if (sta_netif == nullptr) {
        return false;
    }
    // The default STA netif starts its DHCP client on association; this only
    // restarts it if something stopped it.
    esp_netif_dhcp_status_t status = ESP_NETIF_DHCP_INIT;
    esp_err_t err = esp_netif_dhcpc_get_status(sta_netif, &status);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "DHCP status query failed: %d", static_cast<int>(err));
        return false;
    }
    if (status != ESP_NETIF_DHCP_STARTED) {
        err = esp_netif_dhcpc_start(sta_netif);
        if (err != ESP_OK && err != ESP_ERR_ESP_NETIF_DHCP_ALREADY_STARTED) {
            LOG_ERROR(TAG, "DHCP start failed: %d", static_cast<int>(err));
            return false;
        }
    }
    return true;
}

bool EspWifiRadio::leasedAddress(char* out, std::size_t len) {
    if (!got_ip.load()) {
        return false;
    }
    esp_ip4_addr_t ip;
    ip.addr = ip_addr.load();
    int n = snprintf(out, len, IPSTR, IP2STR(&ip));
    return n > 0 && static_cast<std::size_t>(n) < len;
}

int8_t EspWifiRadio::rssi() {
    wifi_ap_record_t ap_info = {};
    if (esp_wifi_sta_get_ap_info(&ap_info) != ESP_OK) {
        return 0;
    }
    return ap_info.rssi;
}

void EspWifiRadio::disconnect() {
    esp_err_t err = esp_wifi_disconnect();
    if (err != ESP_OK && err != ESP_ERR_WIFI_NOT_STARTED) {
        LOG_WARN(TAG, "esp_wifi_disconnect failed: %d", static_cast<int>(err));
    }
    assoc_status = AssociationStatus::IDLE;
    got_ip = false;
    ip_addr = 0;
}

void EspWifiRadio::wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data) {
    EspWifiRadio* self = static_cast<EspWifiRadio*>(arg);
    switch (event_id) {
        case WIFI_EVENT_STA_START:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_START");
            break;
        case WIFI_EVENT_STA_CONNECTED:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_CONNECTED");
            self->assoc_status = AssociationStatus::ASSOCIATED;
            break;
        case WIFI_EVENT_STA_DISCONNECTED: {
            const wifi_event_sta_disconnected_t* info = static_cast<const wifi_event_sta_disconnected_t*>(event_data);
            LOG_WARN(TAG, "WIFI_EVENT_STA_DISCONNECTED (reason %d)", info != nullptr ? static_cast<int>(info->reason) : -1);
            // No driver-level retry; the connectivity manager owns the policy
            if (self->assoc_status.load() == AssociationStatus::PENDING) {
                self->assoc_status = AssociationStatus::FAILED;
            } else {
                self->assoc_status = AssociationStatus::IDLE;
            }
            self->got_ip = false;
            break;
        }
        case WIFI_EVENT_STA_STOP:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_STOP");
            self->assoc_status = AssociationStatus::IDLE;
            self->got_ip = false;
            break;
        default:
            break;
    }
}

void EspWifiRadio::ipEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data) {
    EspWifiRadio* self = static_cast<EspWifiRadio*>(arg);
    if (event_id == IP_EVENT_STA_GOT_IP) {
        const ip_event_got_ip_t* event = static_cast<const ip_event_got_ip_t*>(event_data);
        self->ip_addr = event->ip_info.ip.addr;
        self->got_ip = true;
        LOG_INFO(TAG, "Got IP address " IPSTR, IP2STR(&event->ip_info.ip));
    } else if (event_id == IP_EVENT_STA_LOST_IP) {
        LOG_WARN(TAG, "%s", "Lost IP address");
        self->got_ip = false;
        self->ip_addr = 0;
    }
}
