#include <main/network/mqtt_codec.hpp>
#include <cstring>

namespace {
    static constexpr char PROTOCOL_NAME[] = "MQTT";
    static constexpr std::size_t PROTOCOL_NAME_LEN = 4;

    static std::size_t remainingLengthSize(uint32_t value) {
        if (value < 128u) return 1;
        if (value < 16384u) return 2;
        if (value < 2097152u) return 3;
        return 4;
    }

    static uint8_t* putU16(uint8_t* p, uint16_t v) {
        *p++ = static_cast<uint8_t>(v >> 8);
        *p++ = static_cast<uint8_t>(v & 0xFF);
        return p;
    }

    static uint8_t* putString(uint8_t* p, const char* s, std::size_t len) {
        p = putU16(p, static_cast<uint16_t>(len));
        std::memcpy(p, s, len);
        return p + len;
    }
}

namespace MqttCodec {

std::size_t encodeRemainingLength(uint32_t value, uint8_t* out, std::size_t cap) {
    if (value > MAX_REMAINING_LENGTH || out == nullptr) {
        return 0;
    }
    std::size_t n = 0;
    do {
        if (n >= cap) {
            return 0;
        }
        uint8_t byte = static_cast<uint8_t>(value % 128);
        value /= 128;
        if (value > 0) {
            byte |= 0x80;
        }
        out[n++] = byte;
    } while (value > 0);
    return n;
}

bool decodeRemainingLength(const uint8_t* in, std::size_t len, uint32_t& value, std::size_t& consumed) {
    uint32_t result = 0;
    uint32_t multiplier = 1;
    for (std::size_t i = 0; i < MAX_REMAINING_LENGTH_BYTES; ++i) {
        if (i >= len) {
            return false;
        }
        result += static_cast<uint32_t>(in[i] & 0x7F) * multiplier;
        if ((in[i] & 0x80) == 0) {
            value = result;
            consumed = i + 1;
            return true;
        }
        multiplier *= 128;
    }
    return false;
}

std::size_t encodeConnect(const char* client_id, uint16_t keepalive_s, uint8_t* out, std::size_t cap) {
    if (client_id == nullptr || out == nullptr) {
        return 0;
    }
    const std::size_t id_len = std::strlen(client_id);
    if (id_len == 0 || id_len > MAX_CLIENT_ID_LEN) {
        return 0;
    }
    // name(2+4) level(1) flags(1) keepalive(2) id(2+n)
    const uint32_t remaining = static_cast<uint32_t>(2 + PROTOCOL_NAME_LEN + 1 + 1 + 2 + 2 + id_len);
    const std::size_t total = 1 + remainingLengthSize(remaining) + remaining;
    if (total > cap) {
        return 0;
    }

    uint8_t* p = out;
    *p++ = PACKET_CONNECT;
    p += encodeRemainingLength(remaining, p, cap - 1);
    p = putString(p, PROTOCOL_NAME, PROTOCOL_NAME_LEN);
    *p++ = PROTOCOL_LEVEL;
    *p++ = CONNECT_FLAG_CLEAN_SESSION;
    p = putU16(p, keepalive_s);
    p = putString(p, client_id, id_len);
    return static_cast<std::size_t>(p - out);
}

std::size_t encodePublish(const char* topic, const uint8_t* payload, std::size_t payload_len,
                          uint8_t* out, std::size_t cap) {
    if (topic == nullptr || out == nullptr || (payload == nullptr && payload_len > 0)) {
        return 0;
    }
    const std::size_t topic_len = std::strlen(topic);
    if (topic_len == 0 || topic_len > 0xFFFF) {
        return 0;
    }
    // Wildcards are only legal in subscriptions
    if (std::strpbrk(topic, "+#") != nullptr) {
        return 0;
    }
    const uint64_t remaining64 = 2u + static_cast<uint64_t>(topic_len) + static_cast<uint64_t>(payload_len);
    if (remaining64 > MAX_REMAINING_LENGTH) {
        return 0;
    }
    const uint32_t remaining = static_cast<uint32_t>(remaining64);
    const uint64_t total = 1u + remainingLengthSize(remaining) + remaining64;
    if (total > cap) {
        return 0;
    }

    uint8_t* p = out;
    *p++ = PACKET_PUBLISH;
    p += encodeRemainingLength(remaining, p, cap - 1);
    p = putString(p, topic, topic_len);
    if (payload_len > 0) {
        std::memcpy(p, payload, payload_len);
        p += payload_len;
    }
    return static_cast<std::size_t>(p - out);
}

std::size_t encodeDisconnect(uint8_t* out, std::size_t cap) {
    if (out == nullptr || cap < 2) {
        return 0;
    }
    out[0] = PACKET_DISCONNECT;
    out[1] = 0x00;
    return 2;
}

ConnackResult parseConnack(const uint8_t* in, std::size_t len, uint8_t& return_code) {
    if (in == nullptr || len < CONNACK_LEN || in[0] != PACKET_CONNACK || in[1] != 0x02) {
        return ConnackResult::MALFORMED;
    }
    // Only bit 0 (session present) may be set in the acknowledge flags
    if ((in[2] & 0xFE) != 0) {
        return ConnackResult::MALFORMED;
    }
    return_code = in[3];
    return (return_code == 0) ? ConnackResult::ACCEPTED : ConnackResult::REFUSED;
}

}
