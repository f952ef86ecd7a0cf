// Minimal logging utility (header-only) for the SshDeck core.
// Enabled with SSHDECK_LOG=1 (or SSHDECK_LOG=debug for debug lines).
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>
#include <cstring>

namespace sshdeck {

inline bool logEnabled() {
    const char* v = std::getenv("SSHDECK_LOG");
    return v && *v && *v != '0';
}

inline bool debugLogEnabled() {
    const char* v = std::getenv("SSHDECK_LOG");
    return v && std::strcmp(v, "debug") == 0;
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    // Format the whole line first so concurrent sessions do not interleave output.
    char line[1024];
    int n = std::snprintf(line, sizeof(line), "[SshDeck][%s] ", level);
    if (n < 0) return;
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(line + n, sizeof(line) - (std::size_t)n, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "%s\n", line);
}

} // namespace sshdeck

#define LOGD(fmt, ...) \
    do { \
        if (sshdeck::debugLogEnabled()) \
            sshdeck::logf("DEBUG", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGI(fmt, ...) \
    do { \
        if (sshdeck::logEnabled()) \
            sshdeck::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (sshdeck::logEnabled()) \
            sshdeck::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (sshdeck::logEnabled()) \
            sshdeck::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
