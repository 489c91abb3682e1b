#pragma once

#include <cstddef>
#include <cstdint>

namespace keylink::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

void early_logf(const char* fmt, ...);

#if defined(KL_DEBUG)

// Real functions exist only in debug builds.
void logf(Level level, const char* tag, const char* fmt, ...);

// Hex dump of at most the first 32 bytes, at Verbose level.
void log_hex(const char* tag, const char* label, const std::uint8_t* data, std::size_t len);

#else

// In non-debug builds, provide inline no-op stubs so
// any direct calls still compile but vanish.
template <typename... Args>
inline void logf(Level, const char*, const char*, Args&&...) {}

inline void log_hex(const char*, const char*, const std::uint8_t*, std::size_t) {}

#endif // KL_DEBUG

} // namespace keylink::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#define KL_ELOG(fmt, ...) ::keylink::log::early_logf(fmt "\n", ##__VA_ARGS__)

#if defined(KL_DEBUG)

#define KL_LOGE(tag, fmt, ...) \
    ::keylink::log::logf(::keylink::log::Level::Error,   tag, fmt, ##__VA_ARGS__)

#define KL_LOGW(tag, fmt, ...) \
    ::keylink::log::logf(::keylink::log::Level::Warn,    tag, fmt, ##__VA_ARGS__)

#define KL_LOGI(tag, fmt, ...) \
    ::keylink::log::logf(::keylink::log::Level::Info,    tag, fmt, ##__VA_ARGS__)

#define KL_LOGD(tag, fmt, ...) \
    ::keylink::log::logf(::keylink::log::Level::Debug,   tag, fmt, ##__VA_ARGS__)

#define KL_LOGV(tag, fmt, ...) \
    ::keylink::log::logf(::keylink::log::Level::Verbose, tag, fmt, ##__VA_ARGS__)

#define KL_LOG_HEX(tag, label, data, len) \
    ::keylink::log::log_hex(tag, label, data, len)

#else

// In non-debug builds the whole macro invocation (including arguments /
// fmt strings) disappears at preprocessing time.

#define KL_LOGE(tag, fmt, ...) ((void)0)
#define KL_LOGW(tag, fmt, ...) ((void)0)
#define KL_LOGI(tag, fmt, ...) ((void)0)
#define KL_LOGD(tag, fmt, ...) ((void)0)
#define KL_LOGV(tag, fmt, ...) ((void)0)
#define KL_LOG_HEX(tag, label, data, len) ((void)0)

#endif // KL_DEBUG
