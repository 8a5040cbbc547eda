#include <main/utils/logger.hpp>
#include <cstdio>

// Default log level
LogLevel Logger::s_level = LogLevel::INFO;
Logger::Sink Logger::s_sink = &Logger::stderrSink;

void Logger::setLevel(LogLevel level) {
    s_level = level;
}

LogLevel Logger::getLevel() {
    return s_level;
}

void Logger::setSink(Sink sink) {
    s_sink = (sink != nullptr) ? sink : &Logger::stderrSink;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "E";
        case LogLevel::WARN:  return "W";
        case LogLevel::INFO:  return "I";
        case LogLevel::DEBUG: return "D";
        default:              return "?";
    }
}

void Logger::stderrSink(LogLevel level, const char* tag, const char* message) {
    std::fprintf(stderr, "%s (%s) %s\n", levelName(level), tag, message);
}

void Logger::logFormatted(LogLevel gate_level, const char* tag, const char* fmt, va_list args) {
    if (static_cast<int>(s_level) < static_cast<int>(gate_level)) {
        return;
    }
    char buffer[LOGGER_MAX_MESSAGE_LEN];
    int n = vsnprintf(buffer, sizeof(buffer), fmt, args);
    if (n < 0) {
        // Formatting error; emit a minimal message without heap
        s_sink(gate_level, tag, "formatting error");
        return;
    }
    // Ensure null-terminated within fixed buffer
    buffer[sizeof(buffer) - 1] = '\0';
    s_sink(gate_level, tag, buffer);
}

void Logger::error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::ERROR, tag, fmt, args);
    va_end(args);
}

void Logger::warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::WARN, tag, fmt, args);
    va_end(args);
}

void Logger::info(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::INFO, tag, fmt, args);
    va_end(args);
}

void Logger::debug(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logFormatted(LogLevel::DEBUG, tag, fmt, args);
    va_end(args);
}
