#include <engram/core/logger.hpp>

namespace engram {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::debug(const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl("DEBUG", fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl("INFO", fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl("WARN", fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_impl("ERROR", fmt, args);
    va_end(args);
}

Logger::Logger() : level_(LogLevel::INFO) {}

void Logger::log_impl(const char* level_str, const char* fmt, va_list args) {
    // Format outside the lock; workers log concurrently
    char message[2048];
    vsnprintf(message, sizeof(message), fmt, args);

    time_t now = time(NULL);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    std::lock_guard<std::mutex> lock(write_mutex_);
    fprintf(stderr, "[%s] [%s] %s\n", timestamp, level_str, message);
    fflush(stderr);
}

} // namespace engram
