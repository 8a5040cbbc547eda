#ifndef ESP_WIFI_RADIO_HPP
#define ESP_WIFI_RADIO_HPP

#include <atomic>
#include <cstdint>
#include <esp_wifi.h>
#include <esp_event.h>
#include <esp_netif.h>
#include <main/network/wifi_radio.hpp>

// WifiRadio over the ESP-IDF station driver. Event handlers run in the
// default event loop task and only update the atomics below.
class EspWifiRadio : public WifiRadio {
public:
    EspWifiRadio();

    // Netif, event loop and driver bring-up. NVS must already be initialized.
    bool init();

    bool beginAssociation(const char* ssid, const char* password) override;
    AssociationStatus associationStatus() override;
    bool requestLease() override;
    bool leasedAddress(char* out, std::size_t len) override;
    int8_t rssi() override;
    void disconnect() override;

private:
    static void wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);
    static void ipEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);

    bool initialized;
    esp_netif_t* sta_netif;
    std::atomic<AssociationStatus> assoc_status;
    std::atomic<bool> got_ip;
    std::atomic<uint32_t> ip_addr; // network byte order

    esp_event_handler_instance_t wifi_any_id_instance;
    esp_event_handler_instance_t ip_any_id_instance;
};

#endif // ESP_WIFI_RADIO_HPP
