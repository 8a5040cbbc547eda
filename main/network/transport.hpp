#ifndef TRANSPORT_HPP
#define TRANSPORT_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/errors.hpp>

// Byte stream to the broker. One connection at a time; every call is bounded
// by the timeout it is given.
class Transport {
public:
    virtual ~Transport() = default;

    virtual TransportStatus connect(const char* host, uint16_t port, uint32_t timeout_ms) = 0;
    // Writes all len bytes or fails
    virtual TransportStatus write(const uint8_t* data, std::size_t len, uint32_t timeout_ms) = 0;
    // Reads exactly len bytes or fails
    virtual TransportStatus read(uint8_t* out, std::size_t len, uint32_t timeout_ms) = 0;
    // Safe to call when not connected
    virtual void close() = 0;
};

#endif // TRANSPORT_HPP
