#ifndef MQTT_CODEC_HPP
#define MQTT_CODEC_HPP

#include <cstddef>
#include <cstdint>

// Encoder for the publish-only MQTT 3.1.1 subset. Encoders return the number
// of bytes written, or 0 when the frame cannot be represented or does not fit.
namespace MqttCodec {
    // Control packet types (fixed header, high nibble)
    static constexpr uint8_t PACKET_CONNECT    = 0x10;
    static constexpr uint8_t PACKET_CONNACK    = 0x20;
    static constexpr uint8_t PACKET_PUBLISH    = 0x30; // QoS0, DUP=0, RETAIN=0
    static constexpr uint8_t PACKET_DISCONNECT = 0xE0;

    static constexpr uint8_t PROTOCOL_LEVEL = 4;          // 3.1.1
    static constexpr uint8_t CONNECT_FLAG_CLEAN_SESSION = 0x02;

    static constexpr uint32_t MAX_REMAINING_LENGTH = 268435455; // 4 varint bytes
    static constexpr std::size_t MAX_REMAINING_LENGTH_BYTES = 4;
    static constexpr std::size_t MAX_CLIENT_ID_LEN = 23;
    static constexpr std::size_t CONNACK_LEN = 4;

    enum class ConnackResult : uint8_t {
        ACCEPTED = 0,
        REFUSED,   // Well-formed, non-zero return code
        MALFORMED
    };

    std::size_t encodeRemainingLength(uint32_t value, uint8_t* out, std::size_t cap);
    // Returns false on truncated input or a fifth continuation byte
    bool decodeRemainingLength(const uint8_t* in, std::size_t len, uint32_t& value, std::size_t& consumed);

    std::size_t encodeConnect(const char* client_id, uint16_t keepalive_s, uint8_t* out, std::size_t cap);
    std::size_t encodePublish(const char* topic, const uint8_t* payload, std::size_t payload_len,
                              uint8_t* out, std::size_t cap);
    std::size_t encodeDisconnect(uint8_t* out, std::size_t cap);

    ConnackResult parseConnack(const uint8_t* in, std::size_t len, uint8_t& return_code);
}

#endif // MQTT_CODEC_HPP
