#ifndef CONNECTION_STATE_HPP
#define CONNECTION_STATE_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/errors.hpp>

enum class LinkState : uint8_t {
    IDLE = 0,
    CONNECTING,
    CONNECTED,
    DISCONNECTED
};

// Dotted-quad IPv4 text, "255.255.255.255" plus terminator
static constexpr std::size_t IP_ADDRESS_MAX_LEN = 16;

// Snapshot of the connectivity state machine. address is set only while
// kind == CONNECTED, reason only while kind == DISCONNECTED.
struct ConnectionState {
    LinkState    kind;
    char         address[IP_ADDRESS_MAX_LEN];
    NetworkError reason;
};

const char* toString(LinkState state);

#endif // CONNECTION_STATE_HPP
