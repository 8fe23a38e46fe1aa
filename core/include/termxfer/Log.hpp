// Minimal logging utility (header-only) for the termxfer core, plus the
// runtime policy helpers that decide whether sensitive values may be logged.
#pragma once

#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace termxfer {

inline std::string normalizedEnv(const char *name) {
    if (!name)
        return {};
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    std::string out(raw);
    std::size_t start = 0;
    while (start < out.size() &&
           std::isspace(static_cast<unsigned char>(out[start]))) {
        ++start;
    }
    std::size_t end = out.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(out[end - 1]))) {
        --end;
    }
    out = out.substr(start, end - start);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool isDevEnvironment() {
    const std::string env = normalizedEnv("TERMXFER_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

// Remote paths and user names are only logged when explicitly allowed.
inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("TERMXFER_LOG_SENSITIVE");
}

inline bool logEnabled() {
    return envFlagEnabled("TERMXFER_LOG");
}

inline void logf(const char *level, const char *fmt, ...) {
    if (!logEnabled())
        return;
    std::fprintf(stderr, "[termxfer][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

// Returns the value itself when sensitive logging is on, a placeholder otherwise.
inline const char *redact(const std::string &value) {
    return sensitiveLoggingEnabled() ? value.c_str() : "<redacted>";
}

} // namespace termxfer

#define LOGI(fmt, ...) \
    do { \
        if (termxfer::logEnabled()) \
            termxfer::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (termxfer::logEnabled()) \
            termxfer::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
