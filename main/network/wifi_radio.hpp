#ifndef WIFI_RADIO_HPP
#define WIFI_RADIO_HPP

#include <cstddef>
#include <cstdint>

enum class AssociationStatus : uint8_t {
    IDLE = 0,   // No request outstanding
    PENDING,
    ASSOCIATED,
    FAILED      // Rejected, auth failure or AP not found
};

// Station-mode radio. Every call returns immediately; completion is observed
// by polling, so the caller decides how long to wait.
class WifiRadio {
public:
    virtual ~WifiRadio() = default;

    virtual bool beginAssociation(const char* ssid, const char* password) = 0;
    virtual AssociationStatus associationStatus() = 0;

    // Start DHCP on an associated link
    virtual bool requestLease() = 0;
    // Copies the dotted-quad address once a lease is held
    virtual bool leasedAddress(char* out, std::size_t len) = 0;

    virtual int8_t rssi() = 0;
    virtual void disconnect() = 0;
};

#endif // WIFI_RADIO_HPP
