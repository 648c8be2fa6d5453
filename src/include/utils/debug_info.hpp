/**
 * @file debug_info.hpp
 * @brief Provides debugging utilities: stack trace printing, panic handling for
 *        fatal errors, and debug messaging.
 *
 * The capture library cannot report its own problems through the logging facade
 * it implements (anything logged would land in the capture queue under test), so
 * every internal diagnostic goes straight to `stderr` through the functions here.
 * `fmt` provides compile-time format string checks and `std::source_location`
 * provides automatic source code location reporting.
 */

// -- Debugging utilities: stack trace printing, panic and debug messages
#pragma once

#include <cstdio>         // for fflush
#include <cstdlib>        // for std::abort
#include <fmt/format.h>   // for fmt::format_string, fmt::print, fmt::format
#include <source_location> // for std::source_location
#include <string>         // for std::string
#include <string_view>    // for std::string_view

#include "logtest_platform.hpp"
#include "utils/format_tools.hpp" // for logtest::format_tools::filename_only

namespace logtest::debug
{

/**
 * @brief Prints the current call stack (stack trace) to `stderr`.
 *
 * On POSIX systems it uses `backtrace`, `dladdr` and `__cxa_demangle`. On other
 * platforms only a placeholder line is printed. Errors during capture are
 * reported to `stderr`; the function never throws.
 */
LOGTEST_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Renders a source location as `file:line:function`.
 */
inline std::string srcloc_to_str(std::source_location loc)
{
    return fmt::format("{}:{}:{}", format_tools::filename_only(loc.file_name()), loc.line(),
                       loc.function_name());
}

/**
 * @brief Halts program execution with a fatal error message and prints a stack trace.
 *
 * Intended for unrecoverable errors. It formats and prints an error message to
 * `stderr`, along with the source location where `panic` was called, then calls
 * `print_stack_trace()` and `std::abort()`.
 *
 * @param loc The source location where `panic` was called. Captured by `LOGTEST_PANIC`.
 * @param fmt_str The `fmt`-style format string for the error message.
 * @param args The arguments to be formatted into `fmt_str`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", srcloc_to_str(loc), body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[PANIC] {} -- FATAL FORMAT ERROR WHEN PANIC fmt_str['{}']\n"
                   "[PANIC]  Exception: '{}'\n",
                   srcloc_to_str(loc), fmt::string_view(fmt_str), e.what());
    }
    catch (...)
    {
        std::fputs("[PANIC] FATAL UNKNOWN EXCEPTION DURING PANIC\n", stderr);
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr` with compile-time format string checking.
 *
 * Output format is `[DBG]  <message>\n`. Normally reached through `LOGTEST_DBG`,
 * which compiles away unless `LOGTEST_ENABLE_DEBUG_MESSAGES` is defined.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const fmt::format_error &e)
    {
        fmt::print(stderr,
                   "[DBG]  FATAL FORMAT ERROR DURING DEBUG_MSG: fmt_str['{}']\n"
                   "[DBG]  Exception: '{}'\n",
                   fmt::string_view(fmt_str), e.what());
        std::fflush(stderr);
    }
    catch (...)
    {
        std::fputs("[DBG]  FATAL EXCEPTION DURING DEBUG_MSG\n", stderr);
        std::fflush(stderr);
    }
}

} // namespace logtest::debug

// ---------------- thin macros for convenience --------------

/**
 * @brief Calls `logtest::debug::panic` with automatic source location.
 * @param fmt The `fmt`-style format string literal.
 */
#ifndef LOGTEST_PANIC
#define LOGTEST_PANIC(fmt, ...)                                                                    \
    ::logtest::debug::panic(std::source_location::current(),                                      \
                            FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Calls `logtest::debug::debug_msg` when `LOGTEST_ENABLE_DEBUG_MESSAGES` is defined.
 */
#ifndef LOGTEST_DBG
#if defined(LOGTEST_ENABLE_DEBUG_MESSAGES)
#define LOGTEST_DBG(fmt, ...)                                                                      \
    ::logtest::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define LOGTEST_DBG(fmt, ...)                                                                      \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
