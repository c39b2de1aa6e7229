#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace mountproxy {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// Process-wide line logger writing to stdout. FATAL is a severity only; it
// does not terminate the process.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level) { level_ = level; }
    LogLevel GetLevel() const { return level_; }
    // Case-insensitive; unknown names yield INFO.
    static LogLevel ParseLevel(const std::string& name);

    // ANSI colours per level. Off for files and journald.
    void SetColor(bool enabled) { color_ = enabled; }

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::atomic<bool> color_{true};
    std::mutex mutex_;
};

// Collects one record and emits it on destruction:
//   LOG_INFO << "upstream " << origin;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line) : level_(level), file_(file), line_(line) {}
    ~LogStream() { Logger::Instance().Log(level_, file_, line_, buf_.str()); }

    template <typename T>
    LogStream& operator<<(const T& value) {
        buf_ << value;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::ostringstream buf_;
};

} // namespace common
} // namespace mountproxy

#define MOUNTPROXY_LOG(lvl) \
    if (mountproxy::common::LogLevel::lvl < mountproxy::common::Logger::Instance().GetLevel()) {} \
    else mountproxy::common::LogStream(mountproxy::common::LogLevel::lvl, __FILE__, __LINE__)

#define LOG_DEBUG MOUNTPROXY_LOG(DEBUG)
#define LOG_INFO  MOUNTPROXY_LOG(INFO)
#define LOG_WARN  MOUNTPROXY_LOG(WARN)
#define LOG_ERROR MOUNTPROXY_LOG(ERROR)
#define LOG_FATAL MOUNTPROXY_LOG(FATAL)
