#include "keylink/core/logging.h"

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace keylink::log {

void early_logf(const char* fmt, ...)
{
    if (!fmt) {
        return;
    }

    std::va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
}

#if !defined(KL_DEBUG)

// Non-debug build: nothing else here. Inline stubs in the header handle log calls.

#else

// The reader thread, the FIFO worker and the renewal timer all log;
// keep each line intact.
static std::mutex& log_mutex()
{
    static std::mutex mx;
    return mx;
}

static const char* level_to_str(Level lvl)
{
    switch (lvl) {
    case Level::Error:   return "E";
    case Level::Warn:    return "W";
    case Level::Info:    return "I";
    case Level::Debug:   return "D";
    case Level::Verbose: return "V";
    }
    return "?";
}

static FILE* stream_for(Level level)
{
    return (level == Level::Error || level == Level::Warn) ? stderr : stdout;
}

static void vlogf(Level level, const char* tag, const char* fmt, std::va_list args)
{
    FILE* out = stream_for(level);

    std::lock_guard<std::mutex> g(log_mutex());
    std::fprintf(out, "[%s] %s: ", level_to_str(level), tag ? tag : "log");
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

void logf(Level level, const char* tag, const char* fmt, ...)
{
    std::va_list args;
    va_start(args, fmt);
    vlogf(level, tag, fmt, args);
    va_end(args);
}

void log_hex(const char* tag, const char* label, const std::uint8_t* data, std::size_t len)
{
    char line[3 * 32 + 1] = {0};
    std::size_t pos = 0;

    const std::size_t n = (len < 32) ? len : 32;
    for (std::size_t i = 0; i < n; ++i) {
        int wrote = std::snprintf(line + pos, sizeof(line) - pos, "%02x%s",
                                  data[i], (i + 1 == n) ? "" : " ");
        if (wrote <= 0) {
            break;
        }
        pos += static_cast<std::size_t>(wrote);
        if (pos >= sizeof(line)) {
            line[sizeof(line) - 1] = '\0';
            break;
        }
    }

    logf(Level::Verbose, tag, "%s: %s", label ? label : "data", line);
}

#endif // defined(KL_DEBUG)

} // namespace keylink::log
