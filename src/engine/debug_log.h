/*
TGTelex — Compile-time debug logging macros.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#pragma once

// Compile-time enable/disable. When enabled, logging can still be turned off at
// runtime via DebugLog::SetEnabled(false).
#ifndef TGTELEX_ENABLE_DEBUG_LOG
#define TGTELEX_ENABLE_DEBUG_LOG 0
#endif

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace tgtelex::DebugLog {

inline std::atomic<bool>& enabled_flag()
{
    // Default OFF. Settings key debugLog turns it on.
    static std::atomic<bool> enabled{false};
    return enabled;
}

inline void SetEnabled(bool enabled)
{
    enabled_flag().store(enabled, std::memory_order_relaxed);
}

inline bool IsEnabled()
{
    return enabled_flag().load(std::memory_order_relaxed);
}

inline void Log(const char* fmt, ...)
{
#if TGTELEX_ENABLE_DEBUG_LOG
    if (!IsEnabled()) {
        return;
    }

    const std::time_t now = std::time(nullptr);
    std::tm st{};
#if defined(_WIN32)
    localtime_s(&st, &now);
#else
    localtime_r(&now, &st);
#endif

    std::fprintf(stderr,
                 "[tgtelex %04d-%02d-%02d %02d:%02d:%02d] ",
                 st.tm_year + 1900,
                 st.tm_mon + 1,
                 st.tm_mday,
                 st.tm_hour,
                 st.tm_min,
                 st.tm_sec);

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);

    std::fprintf(stderr, "\n");
#else
    (void)fmt;
#endif
}

} // namespace tgtelex::DebugLog

#if TGTELEX_ENABLE_DEBUG_LOG
#define TGTELEX_LOG(...) ::tgtelex::DebugLog::Log(__VA_ARGS__)
#else
#define TGTELEX_LOG(...) (void)0
#endif
