#pragma once

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace polyserve::core {

enum class LogLevel : int {
    Trace = 1,
    Debug = 2,
    Info = 3,
    Warning = 4,
    Error = 5,
    Fatal = 6,
    None = 7,
};

struct LoggingConfig {
    bool enabled{true};
    LogLevel level{LogLevel::Info};
    std::string file{};

    // One line per served request.
    bool access{true};
};

class Logger {
public:
    static Logger& instance();

    // Applies logging settings (level, optional file sink).
    void init(const LoggingConfig& cfg);
    void shutdown();

    bool enabled(LogLevel level) const;
    bool access_enabled() const;

    void write(LogLevel level, const char* tag, const char* fmt, va_list args);

private:
    Logger();

    mutable std::mutex mutex_;
    LoggingConfig cfg_{};
    std::FILE* file_{nullptr};
    double start_{0.0};
};

// printf-style log line: "[seconds][LEVEL][tag] message".
void logf(LogLevel level, const char* tag, const char* fmt, ...);

const char* log_level_name(LogLevel level);

} // namespace polyserve::core
