#include "logger.hpp"

#include <chrono>

namespace polyserve::core {

namespace {

double now_seconds() {
    using clock = std::chrono::steady_clock;
    return std::chrono::duration<double>(clock::now().time_since_epoch()).count();
}

} // namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::None: return "NONE";
        default: break;
    }
    return "INFO";
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : start_(now_seconds()) {}

void Logger::init(const LoggingConfig& cfg) {
    shutdown();

    std::lock_guard lock(mutex_);
    cfg_ = cfg;

    if (cfg_.enabled && !cfg_.file.empty()) {
        file_ = std::fopen(cfg_.file.c_str(), "a");
        if (!file_) {
            std::fprintf(stderr, "[logger] cannot open log file %s, logging to stderr only\n",
                         cfg_.file.c_str());
        }
    }
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard lock(mutex_);
    return cfg_.enabled && level != LogLevel::None && level >= cfg_.level;
}

bool Logger::access_enabled() const {
    std::lock_guard lock(mutex_);
    return cfg_.enabled && cfg_.access && LogLevel::Info >= cfg_.level;
}

void Logger::write(LogLevel level, const char* tag, const char* fmt, va_list args) {
    std::lock_guard lock(mutex_);
    if (!cfg_.enabled || level == LogLevel::None || level < cfg_.level) {
        return;
    }

    const double t = now_seconds() - start_;
    const char* level_str = log_level_name(level);

    if (file_) {
        va_list args_copy;
        va_copy(args_copy, args);

        std::fprintf(file_, "[%.3f][%s][%s] ", t, level_str, tag);
        std::vfprintf(file_, fmt, args_copy);
        std::fputc('\n', file_);
        std::fflush(file_);

        va_end(args_copy);
    }

    std::fprintf(stderr, "[%.3f][%s][%s] ", t, level_str, tag);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

void logf(LogLevel level, const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    Logger::instance().write(level, tag, fmt, args);
    va_end(args);
}

} // namespace polyserve::core
