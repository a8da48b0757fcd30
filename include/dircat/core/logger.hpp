/*
 * dircat C++ - Logger
 *
 * Process-wide printf-style logger. Lines go to stderr, or to a file once
 * open_file() succeeds. Validation workers log concurrently, so each line is
 * formatted first and written under one lock. Colors only on a terminal.
 */
#ifndef dircat_CORE_LOGGER_HPP
#define dircat_CORE_LOGGER_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace dircat {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }

    // Accepts "debug", "info", "warn" or "error" (case-insensitive).
    // Returns false and leaves the level untouched for anything else.
    bool set_level(const std::string& name);

    bool enabled(LogLevel level) const { return level >= level_.load(); }

    // Append to `path` instead of stderr. False (and stderr kept) on failure.
    bool open_file(const std::string& path);
    void close_file();

    // Worker name shown on every line logged from the calling thread
    static void set_thread_tag(const std::string& tag);

    void log(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

private:
    Logger();
    ~Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void write_line(LogLevel level, const char* file, int line, const char* func,
                    const char* fmt, va_list args);

    std::atomic<LogLevel> level_;
    std::mutex mutex_;
    FILE* sink_;
    bool owns_sink_;
    bool use_color_;
};

#define DIRCAT_LOG(lvl, ...) \
    do { \
        if (dircat::Logger::instance().enabled(lvl)) \
            dircat::Logger::instance().log(lvl, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__); \
    } while (0)

// Convenience macros
#define LOG_DEBUG(...) DIRCAT_LOG(dircat::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  DIRCAT_LOG(dircat::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  DIRCAT_LOG(dircat::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) DIRCAT_LOG(dircat::LogLevel::ERROR, __VA_ARGS__)

} // namespace dircat

#endif // dircat_CORE_LOGGER_HPP
