#pragma once

#include "../core/types.hpp"
#include <cstdio>

// Auto-detect the log sink if the build system did not provide one
#if !defined(MEMPLAN_PLATFORM_POSIX) && \
    !defined(MEMPLAN_PLATFORM_GENERIC)
  #if defined(__unix__) || defined(__APPLE__)
    #define MEMPLAN_PLATFORM_POSIX
  #else
    #define MEMPLAN_PLATFORM_GENERIC
  #endif
#endif

namespace memPlan::platform {

// Centralized logging
#ifndef MEMPLAN_ENABLE_LOGGING
#define MEMPLAN_ENABLE_LOGGING 1 /* NOLINT(cppcoreguidelines-macro-usage) */
#endif

namespace detail {
inline void log_sink(const char* msg) noexcept {
#if defined(MEMPLAN_PLATFORM_POSIX)
    if (msg) { std::puts(msg); }
#else
    (void)msg;
#endif
}
} // namespace detail

inline void log(const char* message) noexcept {
#if MEMPLAN_ENABLE_LOGGING
    detail::log_sink(message);
#else
    (void)message;
#endif
}

template<typename... Args>
inline void logf(const char* fmt, Args... args) noexcept {
#if MEMPLAN_ENABLE_LOGGING
    char buffer[256]; std::snprintf(buffer, sizeof(buffer), fmt, args...); /* NOLINT(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */ log(buffer);
#else
    (void)fmt; ((void)args, ...);
#endif
}

} // namespace memPlan::platform
