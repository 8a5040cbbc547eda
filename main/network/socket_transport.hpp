#ifndef SOCKET_TRANSPORT_HPP
#define SOCKET_TRANSPORT_HPP

#include <main/network/transport.hpp>

// TCP over BSD sockets (lwIP on the device, the host stack in tests).
// host must be an IPv4 literal; connect, write and read are each bounded by
// their timeout_ms.
class SocketTransport : public Transport {
public:
    SocketTransport();
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    TransportStatus connect(const char* host, uint16_t port, uint32_t timeout_ms) override;
    TransportStatus write(const uint8_t* data, std::size_t len, uint32_t timeout_ms) override;
    TransportStatus read(uint8_t* out, std::size_t len, uint32_t timeout_ms) override;
    void close() override;

private:
    TransportStatus waitFor(bool writable, uint32_t timeout_ms);

    int fd;
};

#endif // SOCKET_TRANSPORT_HPP
