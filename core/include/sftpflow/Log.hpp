// Minimal logging utility (header-only) for sftpflow.
// Output goes to stderr; the threshold comes from SFTPFLOW_LOG or setLogLevel().
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>
#include <cstring>

namespace sftpflow {

enum class LogLevel { Debug = 0, Verbose = 1, Info = 2, Warning = 3, Error = 4, Off = 5 };

inline LogLevel logLevelFromString(const char* v) {
    if (!v || !*v || std::strcmp(v, "0") == 0 || std::strcmp(v, "off") == 0) return LogLevel::Off;
    if (std::strcmp(v, "debug") == 0) return LogLevel::Debug;
    if (std::strcmp(v, "verbose") == 0) return LogLevel::Verbose;
    if (std::strcmp(v, "warn") == 0 || std::strcmp(v, "warning") == 0) return LogLevel::Warning;
    if (std::strcmp(v, "error") == 0) return LogLevel::Error;
    return LogLevel::Info; // "1", "info" or anything else
}

// Process-wide threshold. Initialized lazily from the environment.
inline LogLevel& logThreshold() {
    static LogLevel level = logLevelFromString(std::getenv("SFTPFLOW_LOG"));
    return level;
}

inline void setLogLevel(LogLevel level) { logThreshold() = level; }

inline bool logEnabled(LogLevel level) {
    return level >= logThreshold() && logThreshold() != LogLevel::Off;
}

inline void logf(const char* level, const char* fmt, ...) {
    std::fprintf(stderr, "[sftpflow][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace sftpflow

#define SFTPFLOW_LOG_AT(lvl, name, fmt, ...) \
    do { \
        if (sftpflow::logEnabled(lvl)) \
            sftpflow::logf(name, fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGD(fmt, ...) SFTPFLOW_LOG_AT(sftpflow::LogLevel::Debug, "DEBUG", fmt, ##__VA_ARGS__)
#define LOGV(fmt, ...) SFTPFLOW_LOG_AT(sftpflow::LogLevel::Verbose, "VERBOSE", fmt, ##__VA_ARGS__)
#define LOGI(fmt, ...) SFTPFLOW_LOG_AT(sftpflow::LogLevel::Info, "INFO", fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) SFTPFLOW_LOG_AT(sftpflow::LogLevel::Warning, "WARN", fmt, ##__VA_ARGS__)
#define LOGE(fmt, ...) SFTPFLOW_LOG_AT(sftpflow::LogLevel::Error, "ERROR", fmt, ##__VA_ARGS__)
