// Minimal logging utility (header-only) for MeterLink core.
// Enabled with METERLINK_LOG=1; METERLINK_LOG=debug also prints LOGD lines.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>
#include <cstring>

namespace meterlink {

inline bool logEnabled() {
    const char* v = std::getenv("METERLINK_LOG");
    return v && *v && *v != '0';
}

inline bool logDebugEnabled() {
    const char* v = std::getenv("METERLINK_LOG");
    return v && std::strcmp(v, "debug") == 0;
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    std::fprintf(stderr, "[MeterLink][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace meterlink

#define LOGD(fmt, ...) \
    do { \
        if (meterlink::logDebugEnabled()) \
            meterlink::logf("DEBUG", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGI(fmt, ...) \
    do { \
        if (meterlink::logEnabled()) \
            meterlink::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (meterlink::logEnabled()) \
            meterlink::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (meterlink::logEnabled()) \
            meterlink::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
