#pragma once
/**
 * @file logtest_platform.hpp
 * @brief Layer 0: Platform detection macros.
 *
 * Every file that needs the platform macros (LOGTEST_PLATFORM_LINUX,
 * LOGTEST_IS_POSIX, ...) should include this. It is self-contained and can be
 * included at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>

#if defined(PLATFORM_WIN64)

#define LOGTEST_PLATFORM_WIN64 1

#elif defined(PLATFORM_APPLE)

#define LOGTEST_PLATFORM_APPLE 1

#elif defined(PLATFORM_FREEBSD)

#define LOGTEST_PLATFORM_FREEBSD 1

#elif defined(PLATFORM_LINUX)

#define LOGTEST_PLATFORM_LINUX 1

#else
// Fallback detection
#if defined(_WIN64)
#define LOGTEST_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define LOGTEST_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define LOGTEST_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define LOGTEST_PLATFORM_LINUX 1
#else
#define LOGTEST_PLATFORM_UNKNOWN 1
#endif
#endif

// Convenience booleans for source code usage:
#if defined(LOGTEST_PLATFORM_WIN64)
#define LOGTEST_IS_WINDOWS 1
#elif defined(LOGTEST_PLATFORM_APPLE) || defined(LOGTEST_PLATFORM_FREEBSD) ||                      \
    defined(LOGTEST_PLATFORM_LINUX)
#define LOGTEST_IS_POSIX 1
#endif

// --- Require C++20 or later --------------------------------------------------
// std::source_location, __VA_OPT__ and designated initializers are used throughout.
// For MSVC use _MSVC_LANG (MSVC sets __cplusplus only when /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "logtest_export.h"
