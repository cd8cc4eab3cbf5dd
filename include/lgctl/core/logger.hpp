#ifndef lgctl_CORE_LOGGER_HPP
#define lgctl_CORE_LOGGER_HPP

#include <string>
#include <utility>
#include <functional>
#include <cstdio>
#include <ctime>
#include <cstdarg>

namespace lgctl {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    SUCCESS = 2,
    WARN = 3,
    ERROR = 4
};

// Receives every formatted message that passes the level filter.
// When set, replaces the default stderr writer.
typedef std::function<void(LogLevel level, const std::string& message)> LogSink;

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void set_sink(const LogSink& sink);
    void reset_sink();

    void debug(const char* file, int line, const char* func, const char* fmt, ...);
    void info(const char* file, int line, const char* func, const char* fmt, ...);
    void success(const char* file, int line, const char* func, const char* fmt, ...);
    void warn(const char* file, int line, const char* func, const char* fmt, ...);
    void error(const char* file, int line, const char* func, const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    LogLevel level_;
    LogSink sink_;
};

// Parse "debug", "info", "warn", "error" (case-insensitive). Unknown names keep `fallback`.
LogLevel parse_log_level(const std::string& name, LogLevel fallback);

// Convenience macros
#define LOG_DEBUG(...)   lgctl::Logger::instance().debug(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_INFO(...)    lgctl::Logger::instance().info(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_SUCCESS(...) lgctl::Logger::instance().success(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_WARN(...)    lgctl::Logger::instance().warn(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)
#define LOG_ERROR(...)   lgctl::Logger::instance().error(__FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__)

} // namespace lgctl

#endif // lgctl_CORE_LOGGER_HPP
