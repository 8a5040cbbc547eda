#include <main/network/connectivity_manager.hpp>
#include <main/utils/logger.hpp>
#include <cstdio>
#include <cstring>

static const char* TAG = "CONNECTIVITY";

const char* toString(LinkState state) {
    switch (state) {
        case LinkState::IDLE:         return "idle";
        case LinkState::CONNECTING:   return "connecting";
        case LinkState::CONNECTED:    return "connected";
        case LinkState::DISCONNECTED: return "disconnected";
        default:                      return "unknown";
    }
}

ConnectivityManager::ConnectivityManager(WifiRadio& radio_in, const PipelineSettings& settings_in, Lock& lock_in)
    : radio(radio_in),
      settings(settings_in),
      state_lock(lock_in),
      snapshot{LinkState::IDLE, {0}, NetworkError::NONE},
      last_reason(NetworkError::NONE),
      attempts(0),
      started(false),
      phase(Phase::NONE),
      phase_started_ms(0),
      disconnected_at_ms(0) {}

void ConnectivityManager::start() {
    LockGuard guard(state_lock);
    started = true;
}

void ConnectivityManager::poll(uint32_t now_ms) {
    LinkState kind;
    bool go;
    {
        LockGuard guard(state_lock);
        kind = snapshot.kind;
        go = started;
    }
    switch (kind) {
        case LinkState::IDLE:
            if (go) {
                beginAttempt(now_ms);
            }
            break;
        case LinkState::CONNECTING:
            pollConnecting(now_ms);
            break;
        case LinkState::CONNECTED:
            pollConnected(now_ms);
            break;
        case LinkState::DISCONNECTED:
            if (now_ms - disconnected_at_ms >= settings.reconnect_backoff_ms) {
                beginAttempt(now_ms);
            }
            break;
    }
}

void ConnectivityManager::beginAttempt(uint32_t now_ms) {
    uint32_t attempt;
    {
        LockGuard guard(state_lock);
        snapshot.kind = LinkState::CONNECTING;
        snapshot.address[0] = '\0';
        snapshot.reason = NetworkError::NONE;
        attempt = ++attempts;
    }
    phase = Phase::ASSOCIATING;
    phase_started_ms = now_ms;
    LOG_INFO(TAG, "Connecting to SSID: %s (attempt %lu)", settings.wifi_ssid, static_cast<unsigned long>(attempt));
    if (!radio.beginAssociation(settings.wifi_ssid, settings.wifi_password)) {
        LOG_ERROR(TAG, "%s", "Radio refused association request");
        enterDisconnected(NetworkError::ASSOCIATION_FAILED, now_ms);
    }
}

void ConnectivityManager::pollConnecting(uint32_t now_ms) {
    const uint32_t elapsed = now_ms - phase_started_ms;
    AssociationStatus assoc = radio.associationStatus();

    if (phase == Phase::ASSOCIATING) {
        if (assoc == AssociationStatus::ASSOCIATED) {
            LOG_INFO(TAG, "Associated after %lu ms, requesting lease", static_cast<unsigned long>(elapsed));
            phase = Phase::LEASING;
            phase_started_ms = now_ms;
            if (!radio.requestLease()) {
                LOG_ERROR(TAG, "%s", "DHCP request failed to start");
                radio.disconnect();
                enterDisconnected(NetworkError::LEASE_TIMEOUT, now_ms);
            }
        } else if (assoc == AssociationStatus::FAILED) {
            LOG_WARN(TAG, "%s", "Association rejected");
            enterDisconnected(NetworkError::ASSOCIATION_FAILED, now_ms);
        } else if (elapsed >= settings.association_timeout_ms) {
            LOG_WARN(TAG, "Association timed out after %lu ms", static_cast<unsigned long>(elapsed));
            radio.disconnect();
            enterDisconnected(NetworkError::ASSOCIATION_FAILED, now_ms);
        }
        return;
    }

    // LEASING
    if (assoc != AssociationStatus::ASSOCIATED) {
        LOG_WARN(TAG, "%s", "Link dropped while waiting for lease");
        enterDisconnected(NetworkError::LINK_LOST, now_ms);
        return;
    }
    char address[IP_ADDRESS_MAX_LEN];
    if (radio.leasedAddress(address, sizeof(address))) {
        enterConnected(address);
    } else if (elapsed >= settings.lease_timeout_ms) {
        LOG_WARN(TAG, "No DHCP lease after %lu ms", static_cast<unsigned long>(elapsed));
        radio.disconnect();
        enterDisconnected(NetworkError::LEASE_TIMEOUT, now_ms);
    }
}

void ConnectivityManager::pollConnected(uint32_t now_ms) {
    char address[IP_ADDRESS_MAX_LEN];
    if (radio.associationStatus() != AssociationStatus::ASSOCIATED ||
        !radio.leasedAddress(address, sizeof(address))) {
        LOG_WARN(TAG, "%s", "Link lost");
        radio.disconnect();
        enterDisconnected(NetworkError::LINK_LOST, now_ms);
    }
}

void ConnectivityManager::enterConnected(const char* address) {
    {
        LockGuard guard(state_lock);
        snapshot.kind = LinkState::CONNECTED;
        std::snprintf(snapshot.address, sizeof(snapshot.address), "%s", address);
        snapshot.reason = NetworkError::NONE;
        last_reason = NetworkError::NONE;
    }
    phase = Phase::NONE;
    LOG_INFO(TAG, "Connected, address %s", address);
}

void ConnectivityManager::enterDisconnected(NetworkError reason, uint32_t now_ms) {
    {
        LockGuard guard(state_lock);
        snapshot.kind = LinkState::DISCONNECTED;
        snapshot.address[0] = '\0';
        snapshot.reason = reason;
        last_reason = reason;
    }
    phase = Phase::NONE;
    disconnected_at_ms = now_ms;
    LOG_WARN(TAG, "Disconnected (%s), retry in %lu ms", toString(reason),
             static_cast<unsigned long>(settings.reconnect_backoff_ms));
}

ConnectionState ConnectivityManager::state() const {
    LockGuard guard(state_lock);
    return snapshot;
}

bool ConnectivityManager::isConnected() const {
    LockGuard guard(state_lock);
    return snapshot.kind == LinkState::CONNECTED;
}

bool ConnectivityManager::currentAddress(char* out, std::size_t len) const {
    if (out == nullptr || len == 0) {
        return false;
    }
    LockGuard guard(state_lock);
    if (snapshot.kind != LinkState::CONNECTED) {
        out[0] = '\0';
        return false;
    }
    int n = std::snprintf(out, len, "%s", snapshot.address);
    return n >= 0 && static_cast<std::size_t>(n) < len;
}

NetworkError ConnectivityManager::lastReason() const {
    LockGuard guard(state_lock);
    return last_reason;
}

uint32_t ConnectivityManager::attemptCount() const {
    LockGuard guard(state_lock);
    return attempts;
}

int8_t ConnectivityManager::rssi() {
    if (!isConnected()) {
        return 0;
    }
    return radio.rssi();
}
