#ifndef CONNECTIVITY_MANAGER_HPP
#define CONNECTIVITY_MANAGER_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/connection_state.hpp>
#include <main/network/wifi_radio.hpp>
#include <main/state/pipeline_settings.hpp>
#include <main/utils/lock.hpp>

// Owns the Wi-Fi association and the DHCP lease.
//
// IDLE -> CONNECTING -> CONNECTED(address) -> DISCONNECTED(reason)
//      -> CONNECTING after the fixed backoff, forever.
//
// poll() is the only writer and runs in the connectivity task; the query
// methods may be called from any task. state_lock guards what they read.
class ConnectivityManager {
public:
    ConnectivityManager(WifiRadio& radio, const PipelineSettings& settings, Lock& state_lock);

    // Leave IDLE on the next poll()
    void start();
    void poll(uint32_t now_ms);

    ConnectionState state() const;
    bool isConnected() const;
    // false and empty string when not CONNECTED
    bool currentAddress(char* out, std::size_t len) const;
    NetworkError lastReason() const;
    uint32_t attemptCount() const;
    int8_t rssi();

private:
    enum class Phase : uint8_t { NONE, ASSOCIATING, LEASING };

    void beginAttempt(uint32_t now_ms);
    void pollConnecting(uint32_t now_ms);
    void pollConnected(uint32_t now_ms);
    void enterConnected(const char* address);
    void enterDisconnected(NetworkError reason, uint32_t now_ms);

    WifiRadio& radio;
    const PipelineSettings& settings;

    Lock& state_lock; // guards snapshot, last_reason, attempts, started
    ConnectionState snapshot;
    NetworkError last_reason;
    uint32_t attempts;
    bool started;

    // Owned by poll()
    Phase phase;
    uint32_t phase_started_ms;
    uint32_t disconnected_at_ms;
};

#endif // CONNECTIVITY_MANAGER_HPP
