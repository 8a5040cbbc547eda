// Fixed-size container for one publish attempt; built by the scheduler,
// handed to the publisher and dropped afterwards.
#ifndef TELEMETRY_MESSAGE_HPP
#define TELEMETRY_MESSAGE_HPP

#include <cstddef>
#include <main/models/errors.hpp>

struct TelemetryMessage {
    char        topic[96];
    char        payload[256];
    std::size_t payload_len;
};

struct PublishCycleResult {
    bool         success;
    PublishError error;
};

#endif // TELEMETRY_MESSAGE_HPP
