/*
 * Engram C++11 - Logger
 *
 * Process-wide leveled logger writing timestamped lines to stderr.
 */
#ifndef ENGRAM_CORE_LOGGER_HPP
#define ENGRAM_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>

namespace engram {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

inline std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "info";
}

// Unknown names map to INFO
inline LogLevel string_to_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "warn" || s == "warning") return LogLevel::WARN;
    if (s == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(const char* level_str, const char* fmt, va_list args);

    LogLevel level_;
    std::mutex write_mutex_;
};

#define LOG_DEBUG(...) engram::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  engram::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  engram::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) engram::Logger::instance().error(__VA_ARGS__)

} // namespace engram

#endif // ENGRAM_CORE_LOGGER_HPP
