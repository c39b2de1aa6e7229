#include "mountproxy/common/Logger.h"

#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace mountproxy {
namespace common {

namespace {

struct LevelInfo {
    const char* tag;
    const char* color;
};

const LevelInfo kLevels[] = {
    {"DEBUG", "\033[36m"},
    {"INFO ", "\033[32m"},
    {"WARN ", "\033[33m"},
    {"ERROR", "\033[31m"},
    {"FATAL", "\033[35m"},
};

const char kColorReset[] = "\033[0m";

// Cached kernel thread id, matches what top -H shows.
long ThreadId() {
    thread_local const long tid = static_cast<long>(::syscall(SYS_gettid));
    return tid;
}

std::string Timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const long millis = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    struct tm local;
    ::localtime_r(&secs, &local);
    char text[32];
    const size_t n = std::strftime(text, sizeof text, "%Y-%m-%d %H:%M:%S", &local);
    std::snprintf(text + n, sizeof text - n, ".%03ld", millis);
    return text;
}

const char* BaseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

LogLevel Logger::ParseLevel(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    const LevelInfo& info = kLevels[static_cast<int>(level)];

    // [time] [level] [tid] [file:line] message
    std::string record;
    record.reserve(msg.size() + 96);
    if (color_) record += info.color;
    record += "[" + Timestamp() + "] [" + info.tag + "] [" + std::to_string(ThreadId()) + "] [";
    record += BaseName(file);
    record += ":" + std::to_string(line) + "] ";
    record += msg;
    if (color_) record += kColorReset;
    record += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    std::fwrite(record.data(), 1, record.size(), stdout);
    std::fflush(stdout);
}

} // namespace common
} // namespace mountproxy
