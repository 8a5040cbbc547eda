#include <main/utils/logger.hpp>
#include <main/models/errors.hpp>
#include <string>
#include <vector>
#include "test_support.hpp"

struct Line
{
    LogLevel level;
    std::string tag;
    std::string message;
};

static std::vector<Line> s_lines;

static void captureSink(LogLevel level, const char* tag, const char* message)
{
    s_lines.push_back(Line{level, tag, message});
}

static void test_level_gating()
{
    s_lines.clear();
    Logger::setSink(&captureSink);
    Logger::setLevel(LogLevel::WARN);
    LOG_ERROR("T", "e%d", 1);
    LOG_WARN("T", "w%d", 2);
    LOG_INFO("T", "i%d", 3);
    LOG_DEBUG("T", "d%d", 4);
    EXPECT_EQ_INT(s_lines.size(), 2);
    if (s_lines.size() == 2)
    {
        EXPECT_TRUE(s_lines[0].level == LogLevel::ERROR);
        EXPECT_STREQ(s_lines[0].message.c_str(), "e1");
        EXPECT_STREQ(s_lines[1].tag.c_str(), "T");
    }
    Logger::setLevel(LogLevel::DEBUG);
    LOG_DEBUG("T", "%s", "now visible");
    EXPECT_EQ_INT(s_lines.size(), 3);
}

static void test_long_message_truncated()
{
    s_lines.clear();
    Logger::setLevel(LogLevel::INFO);
    const std::string big(1000, 'x');
    LOG_INFO("T", "%s", big.c_str());
    EXPECT_EQ_INT(s_lines.size(), 1);
    if (!s_lines.empty())
    {
        EXPECT_EQ_INT(s_lines[0].message.size(), LOGGER_MAX_MESSAGE_LEN - 1);
    }
}

static void test_error_names()
{
    EXPECT_STREQ(toString(SensorError::NOT_FOUND), "not_found");
    EXPECT_STREQ(toString(PublishError::BROKER_REJECTED), "broker_rejected");
    EXPECT_STREQ(toString(BusStatus::NACK), "nack");
    EXPECT_STREQ(toString(TransportStatus::REFUSED), "refused");
    EXPECT_STREQ(Logger::levelName(LogLevel::WARN), "W");
}

int main()
{
    test_level_gating();
    test_long_message_truncated();
    test_error_names();
    Logger::setSink(nullptr);
    return testResult("logger");
}
