#include <main/models/errors.hpp>

const char* toString(SensorError err) {
    switch (err) {
        case SensorError::OK:                    return "ok";
        case SensorError::NOT_FOUND:             return "not_found";
        case SensorError::COMMUNICATION_TIMEOUT: return "communication_timeout";
        case SensorError::INVALID_READING:       return "invalid_reading";
        case SensorError::CALIBRATION_MISSING:   return "calibration_missing";
    }
    return "unknown";
}

const char* toString(NetworkError err) {
    switch (err) {
        case NetworkError::NONE:               return "none";
        case NetworkError::ASSOCIATION_FAILED: return "association_failed";
        case NetworkError::LEASE_TIMEOUT:      return "lease_timeout";
        case NetworkError::LINK_LOST:          return "link_lost";
    }
    return "unknown";
}

const char* toString(PublishError err) {
    switch (err) {
        case PublishError::OK:              return "ok";
        case PublishError::CONNECT_TIMEOUT: return "connect_timeout";
        case PublishError::BROKER_REJECTED: return "broker_rejected";
        case PublishError::WRITE_FAILED:    return "write_failed";
        case PublishError::ENCODING_ERROR:  return "encoding_error";
    }
    return "unknown";
}

const char* toString(BusStatus status) {
    switch (status) {
        case BusStatus::OK:      return "ok";
        case BusStatus::NACK:    return "nack";
        case BusStatus::TIMEOUT: return "timeout";
        case BusStatus::ERROR:   return "error";
    }
    return "unknown";
}

const char* toString(TransportStatus status) {
    switch (status) {
        case TransportStatus::OK:      return "ok";
        case TransportStatus::TIMEOUT: return "timeout";
        case TransportStatus::REFUSED: return "refused";
        case TransportStatus::CLOSED:  return "closed";
        case TransportStatus::ERROR:   return "error";
    }
    return "unknown";
}
