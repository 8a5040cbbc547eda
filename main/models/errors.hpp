#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstdint>

// Error codes returned by value, esp_err_t style: the zero value is success.

enum class SensorError : uint8_t {
    OK = 0,
    NOT_FOUND,             // No known chip id at either bus address
    COMMUNICATION_TIMEOUT, // Bus did not complete a transaction in time
    INVALID_READING,       // Sentinel raw data or out-of-range result
    CALIBRATION_MISSING    // Read attempted before a successful init()
};

enum class NetworkError : uint8_t {
    NONE = 0,
    ASSOCIATION_FAILED,
    LEASE_TIMEOUT,
    LINK_LOST
};

enum class PublishError : uint8_t {
    OK = 0,
    CONNECT_TIMEOUT,
    BROKER_REJECTED,
    WRITE_FAILED,
    ENCODING_ERROR
};

// Outcome of a single I2C transaction
enum class BusStatus : uint8_t {
    OK = 0,
    NACK,    // Nobody acknowledged the address
    TIMEOUT,
    ERROR
};

// Outcome of a single transport operation
enum class TransportStatus : uint8_t {
    OK = 0,
    TIMEOUT,
    REFUSED,
    CLOSED,
    ERROR
};

const char* toString(SensorError err);
const char* toString(NetworkError err);
const char* toString(PublishError err);
const char* toString(BusStatus status);
const char* toString(TransportStatus status);

#endif // ERRORS_HPP
