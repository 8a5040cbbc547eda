#include <main/network/mqtt_codec.hpp>
#include <cstring>
#include <vector>
#include "test_support.hpp"

static std::size_t encodeLen(uint32_t value, uint8_t* out)
{
    return MqttCodec::encodeRemainingLength(value, out, MqttCodec::MAX_REMAINING_LENGTH_BYTES);
}

static void test_remaining_length_boundaries()
{
    struct Case
    {
        uint32_t value;
        std::size_t bytes;
        uint8_t first;
        uint8_t last;
    };
    const Case cases[] = {
        {0, 1, 0x00, 0x00},
        {127, 1, 0x7F, 0x7F},
        {128, 2, 0x80, 0x01},
        {16383, 2, 0xFF, 0x7F},
        {16384, 3, 0x80, 0x01},
        {2097151, 3, 0xFF, 0x7F},
        {2097152, 4, 0x80, 0x01},
        {268435455, 4, 0xFF, 0x7F},
    };
    for (const Case& c : cases)
    {
        uint8_t buf[4] = {0};
        std::size_t n = encodeLen(c.value, buf);
        EXPECT_EQ_INT(n, c.bytes);
        EXPECT_EQ_INT(buf[0], c.first);
        EXPECT_EQ_INT(buf[n - 1], c.last);

        uint32_t decoded = 0;
        std::size_t consumed = 0;
        EXPECT_TRUE(MqttCodec::decodeRemainingLength(buf, n, decoded, consumed));
        EXPECT_EQ_INT(decoded, c.value);
        EXPECT_EQ_INT(consumed, c.bytes);
    }
}

static void test_remaining_length_overflow()
{
    uint8_t buf[4] = {0};
    EXPECT_EQ_INT(encodeLen(268435456u, buf), 0);
    EXPECT_EQ_INT(encodeLen(0xFFFFFFFFu, buf), 0);

    // Output too small for a two-byte value
    EXPECT_EQ_INT(MqttCodec::encodeRemainingLength(128, buf, 1), 0);

    // Fifth continuation byte
    const uint8_t bad[5] = {0xFF, 0xFF, 0xFF, 0xFF, 0x7F};
    uint32_t value = 0;
    std::size_t consumed = 0;
    EXPECT_FALSE(MqttCodec::decodeRemainingLength(bad, sizeof(bad), value, consumed));
    // Truncated
    const uint8_t partial[2] = {0x80, 0x80};
    EXPECT_FALSE(MqttCodec::decodeRemainingLength(partial, sizeof(partial), value, consumed));
}

static void test_connect_frame()
{
    uint8_t buf[64];
    std::size_t n = MqttCodec::encodeConnect("envmon-01", 60, buf, sizeof(buf));
    const uint8_t expected[] = {
        0x10, 21,                               // CONNECT, remaining length
        0x00, 0x04, 'M', 'Q', 'T', 'T',         // protocol name
        0x04,                                   // level 3.1.1
        0x02,                                   // clean session
        0x00, 0x3C,                             // keep-alive 60 s
        0x00, 0x09, 'e', 'n', 'v', 'm', 'o', 'n', '-', '0', '1',
    };
    EXPECT_EQ_INT(n, sizeof(expected));
    EXPECT_TRUE(std::memcmp(buf, expected, sizeof(expected)) == 0);
}

static void test_connect_client_id_limits()
{
    uint8_t buf[64];
    EXPECT_EQ_INT(MqttCodec::encodeConnect("", 60, buf, sizeof(buf)), 0);
    EXPECT_TRUE(MqttCodec::encodeConnect("abcdefghijklmnopqrstuvw", 60, buf, sizeof(buf)) > 0);  // 23
    EXPECT_EQ_INT(MqttCodec::encodeConnect("abcdefghijklmnopqrstuvwx", 60, buf, sizeof(buf)), 0); // 24
    EXPECT_EQ_INT(MqttCodec::encodeConnect("envmon-01", 60, buf, 10), 0);
}

static void test_publish_frame()
{
    const char* payload = "{\"message\":\"alive\",\"sequence\":1}";
    const std::size_t payload_len = std::strlen(payload);
    uint8_t buf[128];
    std::size_t n = MqttCodec::encodePublish("envmon/heartbeat", reinterpret_cast<const uint8_t*>(payload),
                                             payload_len, buf, sizeof(buf));
    const std::size_t remaining = 2 + 16 + payload_len;
    EXPECT_EQ_INT(n, 2 + remaining);
    EXPECT_EQ_INT(buf[0], 0x30);
    EXPECT_EQ_INT(buf[1], remaining);
    EXPECT_EQ_INT(buf[2], 0x00);
    EXPECT_EQ_INT(buf[3], 16);
    EXPECT_TRUE(std::memcmp(&buf[4], "envmon/heartbeat", 16) == 0);
    EXPECT_TRUE(std::memcmp(&buf[20], payload, payload_len) == 0);
}

static void test_publish_two_byte_length()
{
    std::vector<uint8_t> payload(200, 'x');
    std::vector<uint8_t> buf(512);
    std::size_t n = MqttCodec::encodePublish("t", payload.data(), payload.size(), buf.data(), buf.size());
    // remaining = 2 + 1 + 200 = 203 -> 0xCB 0x01
    EXPECT_EQ_INT(n, 1 + 2 + 203);
    EXPECT_EQ_INT(buf[1], 0xCB);
    EXPECT_EQ_INT(buf[2], 0x01);
}

static void test_publish_rejects_bad_input()
{
    uint8_t buf[64];
    const uint8_t p[1] = {'x'};
    EXPECT_EQ_INT(MqttCodec::encodePublish("", p, 1, buf, sizeof(buf)), 0);
    EXPECT_EQ_INT(MqttCodec::encodePublish("a/+/b", p, 1, buf, sizeof(buf)), 0);
    EXPECT_EQ_INT(MqttCodec::encodePublish("a/#", p, 1, buf, sizeof(buf)), 0);
    EXPECT_EQ_INT(MqttCodec::encodePublish("topic", p, 1, buf, 5), 0);
    // Remaining length past the 4-byte varint limit
    EXPECT_EQ_INT(MqttCodec::encodePublish("t", p, 268435453u, buf, sizeof(buf)), 0);
}

static void test_disconnect_frame()
{
    uint8_t buf[2] = {0};
    EXPECT_EQ_INT(MqttCodec::encodeDisconnect(buf, sizeof(buf)), 2);
    EXPECT_EQ_INT(buf[0], 0xE0);
    EXPECT_EQ_INT(buf[1], 0x00);
    EXPECT_EQ_INT(MqttCodec::encodeDisconnect(buf, 1), 0);
}

static void test_connack_parsing()
{
    uint8_t rc = 0xFF;
    const uint8_t accepted[4] = {0x20, 0x02, 0x00, 0x00};
    EXPECT_TRUE(MqttCodec::parseConnack(accepted, 4, rc) == MqttCodec::ConnackResult::ACCEPTED);
    EXPECT_EQ_INT(rc, 0);

    const uint8_t not_authorized[4] = {0x20, 0x02, 0x00, 0x05};
    EXPECT_TRUE(MqttCodec::parseConnack(not_authorized, 4, rc) == MqttCodec::ConnackResult::REFUSED);
    EXPECT_EQ_INT(rc, 5);

    const uint8_t wrong_type[4] = {0x30, 0x02, 0x00, 0x00};
    EXPECT_TRUE(MqttCodec::parseConnack(wrong_type, 4, rc) == MqttCodec::ConnackResult::MALFORMED);
    const uint8_t wrong_len[4] = {0x20, 0x03, 0x00, 0x00};
    EXPECT_TRUE(MqttCodec::parseConnack(wrong_len, 4, rc) == MqttCodec::ConnackResult::MALFORMED);
    const uint8_t bad_flags[4] = {0x20, 0x02, 0x02, 0x00};
    EXPECT_TRUE(MqttCodec::parseConnack(bad_flags, 4, rc) == MqttCodec::ConnackResult::MALFORMED);
    EXPECT_TRUE(MqttCodec::parseConnack(accepted, 3, rc) == MqttCodec::ConnackResult::MALFORMED);
}

int main()
{
    test_remaining_length_boundaries();
    test_remaining_length_overflow();
    test_connect_frame();
    test_connect_client_id_limits();
    test_publish_frame();
    test_publish_two_byte_length();
    test_publish_rejects_bad_input();
    test_disconnect_frame();
    test_connack_parsing();
    return testResult("mqtt_codec");
}
