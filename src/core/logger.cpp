#include <dircat/core/logger.hpp>
#include <dircat/core/utils.hpp>

#include <cstring>
#include <ctime>
#include <unistd.h>

namespace dircat {

namespace {

thread_local std::string t_thread_tag;

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[34m"; // Blue
        case LogLevel::INFO: return "\033[32m";  // Green
        case LogLevel::WARN: return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
    }
    return "\033[0m";
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

const char* base_name(const char* path) {
    const char* slash = strrchr(path, '/');
    return slash ? slash + 1 : path;
}

// "dircat::ValidationPool::validate(const std::string&, ...)" -> "ValidationPool::validate"
std::string short_function(const char* pretty_function) {
    std::string sig(pretty_function);
    size_t paren = sig.find('(');
    if (paren != std::string::npos) {
        sig.erase(paren);
    }
    size_t space = sig.rfind(' ');
    if (space != std::string::npos) {
        sig.erase(0, space + 1);
    }
    if (!sig.empty() && (sig[0] == '*' || sig[0] == '&')) {
        sig.erase(0, 1);
    }
    const std::string ns = "dircat::";
    if (starts_with(sig, ns)) {
        sig.erase(0, ns.size());
    }
    // Helpers in anonymous namespaces
    const std::string anon = "{anonymous}::";
    if (starts_with(sig, anon)) {
        sig.erase(0, anon.size());
    }
    return sig;
}

} // namespace

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , sink_(stderr)
    , owns_sink_(false)
    , use_color_(isatty(STDERR_FILENO) != 0) {}

Logger::~Logger() {
    close_file();
}

bool Logger::set_level(const std::string& name) {
    std::string lowered = to_lower(trim(name));
    if (lowered == "debug") {
        set_level(LogLevel::DEBUG);
    } else if (lowered == "info") {
        set_level(LogLevel::INFO);
    } else if (lowered == "warn" || lowered == "warning") {
        set_level(LogLevel::WARN);
    } else if (lowered == "error") {
        set_level(LogLevel::ERROR);
    } else {
        return false;
    }
    return true;
}

bool Logger::open_file(const std::string& path) {
    FILE* f = fopen(path.c_str(), "ae");
    if (!f) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (owns_sink_) {
        fclose(sink_);
    }
    sink_ = f;
    owns_sink_ = true;
    use_color_ = false;
    return true;
}

void Logger::close_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (owns_sink_) {
        fclose(sink_);
    }
    sink_ = stderr;
    owns_sink_ = false;
    use_color_ = isatty(STDERR_FILENO) != 0;
}

void Logger::set_thread_tag(const std::string& tag) {
    t_thread_tag = tag;
}

void Logger::log(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(level, file, line, func, fmt, args);
    va_end(args);
}

void Logger::write_line(LogLevel level, const char* file, int line, const char* func,
                        const char* fmt, va_list args) {
    char message[2048];
    vsnprintf(message, sizeof(message), fmt, args);

    time_t now = time(NULL);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    std::string prefix = t_thread_tag.empty() ? "" : "<" + t_thread_tag + "> ";

    std::lock_guard<std::mutex> lock(mutex_);
    const char* color = use_color_ ? level_color(level) : "";
    const char* reset = use_color_ ? "\033[0m" : "";

    if (level_.load() == LogLevel::DEBUG) {
        const char* func_color = use_color_ ? "\033[36m" : "";
        fprintf(sink_, "[%s] %s[%s]%s %s%s(%s)%s at %s:%d %s\n",
                timestamp, color, level_name(level), reset, prefix.c_str(),
                func_color, short_function(func).c_str(), reset,
                base_name(file), line, message);
    } else {
        fprintf(sink_, "[%s] %s[%s]%s %s%s\n",
                timestamp, color, level_name(level), reset, prefix.c_str(), message);
    }
    fflush(sink_);
}

} // namespace dircat
