/*******************************************************************************
 * @file log_facade.hpp
 * @brief Process-wide logging facade: one install-once sink slot, a global
 *        level threshold and the `LOGTEST_*` logging macros.
 *
 * **Design**
 * 1.  **Single destination**: exactly one `LogSink` can ever be installed, via
 *     `try_set_sink()`. The slot moves Uninitialized -> Initializing -> Initialized
 *     once; every later attempt returns false. Until then every call is routed
 *     to a no-op sink.
 * 2.  **Two-stage filtering**: `LOGTEST_COMPILE_LEVEL` removes calls more verbose
 *     than it at compile time; `set_max_level()` filters at run time. The
 *     runtime default is `LevelFilter::L_OFF`.
 * 3.  **Synchronous dispatch**: the message is formatted on the calling thread
 *     and handed to the sink before the macro returns. The facade holds no lock
 *     while calling the sink.
 *
 * **Usage**
 * ```cpp
 * LOGTEST_INFO("user {} logged in", user_id);
 * LOGTEST_WARN_KV(logtest::fields({{"retries", n}}), "connection unstable");
 * LOGTEST_LOG(logtest::Level::L_DEBUG, "db", logtest::KeyValues{}, "query took {}ms", ms);
 * ```
 *
 * The default target of the level macros is `LOGTEST_TARGET` when the
 * translation unit defines it before including this header, otherwise the
 * name of the calling source file.
 ******************************************************************************/
#pragma once

#include <atomic>
#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "logtest_platform.hpp"
#include "utils/format_tools.hpp"
#include "utils/log_level.hpp"
#include "utils/log_sinks/sink.hpp"

// Default initial reserve for fmt::memory_buffer used by log_fmt.
#ifndef LOGTEST_FMT_BUFFER_RESERVE
#define LOGTEST_FMT_BUFFER_RESERVE (256u)
#endif

// --- Compile-Time Log Level ---
// Read at each call site; a translation unit may #undef and redefine it before
// including this header.
#ifndef LOGTEST_COMPILE_LEVEL
#define LOGTEST_COMPILE_LEVEL 5 // 0=Off, 1=Error, 2=Warn, 3=Info, 4=Debug, 5=Trace
#endif

namespace logtest::utils
{

/**
 * @brief Installs `sink` as the process's single log destination.
 * @param sink Must outlive every later log call (in practice: the process).
 * @return false if a sink is already installed or another installation is in
 *         progress; the slot is left untouched in that case.
 */
[[nodiscard]] LOGTEST_EXPORT bool try_set_sink(LogSink &sink) noexcept;

/// True once `try_set_sink()` has succeeded.
LOGTEST_EXPORT bool sink_installed() noexcept;

/// The installed sink, or a sink that discards everything before installation.
LOGTEST_EXPORT LogSink &sink() noexcept;

LOGTEST_EXPORT void set_max_level(LevelFilter filter) noexcept;
LOGTEST_EXPORT LevelFilter max_level() noexcept;

/// Flushes the installed sink.
LOGTEST_EXPORT void flush();

/// True if an event at `lvl` for `target` would reach the installed sink.
LOGTEST_EXPORT bool log_enabled(Level lvl, std::string_view target) noexcept;

/**
 * @brief Hands a fully formatted event to the installed sink.
 *
 * Used by `log_fmt`; callers normally go through the macros.
 */
LOGTEST_EXPORT void dispatch(const Metadata &metadata, std::string_view args,
                             const KeyValues &key_values) noexcept;

/**
 * @brief Formats and dispatches one log call.
 *
 * `compile_level` is the caller's `LOGTEST_COMPILE_LEVEL`. Calls more verbose
 * than it compile to nothing.
 *
 * A formatting failure does not propagate: the event is still delivered with
 * the body `[FORMAT ERROR] <what>`.
 */
template <Level lvl, int compile_level, typename... Args>
void log_fmt(std::string_view target, const KeyValues &key_values,
             fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) <= compile_level)
    {
        if (!log_enabled(lvl, target))
            return;

        fmt::memory_buffer mb;
        try
        {
            mb.reserve(LOGTEST_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
        }
        catch (const std::exception &ex)
        {
            mb.clear();
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
        }
        catch (...)
        {
            mb.clear();
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] unknown exception");
        }
        dispatch(Metadata{lvl, target}, format_tools::buffer_view(mb), key_values);
    }
}

} // namespace logtest::utils

#ifndef LOGTEST_TARGET
#define LOGTEST_TARGET (::logtest::format_tools::filename_only(__FILE__))
#endif

// --- Macro Implementation ---
#define LOGTEST_LOG(lvl, target, kvs, fmt, ...)                                                    \
    ::logtest::utils::log_fmt<lvl, LOGTEST_COMPILE_LEVEL>((target), (kvs),                      \
                                                          FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGTEST_ERROR(fmt, ...)                                                                    \
    LOGTEST_LOG(::logtest::utils::Level::L_ERROR, LOGTEST_TARGET, ::logtest::utils::KeyValues{},  \
                fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGTEST_WARN(fmt, ...)                                                                     \
    LOGTEST_LOG(::logtest::utils::Level::L_WARN, LOGTEST_TARGET, ::logtest::utils::KeyValues{},   \
                fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGTEST_INFO(fmt, ...)                                                                     \
    LOGTEST_LOG(::logtest::utils::Level::L_INFO, LOGTEST_TARGET, ::logtest::utils::KeyValues{},   \
                fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGTEST_DEBUG(fmt, ...)                                                                    \
    LOGTEST_LOG(::logtest::utils::Level::L_DEBUG, LOGTEST_TARGET, ::logtest::utils::KeyValues{},  \
                fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGTEST_TRACE(fmt, ...)                                                                    \
    LOGTEST_LOG(::logtest::utils::Level::L_TRACE, LOGTEST_TARGET, ::logtest::utils::KeyValues{},  \
                fmt __VA_OPT__(, ) __VA_ARGS__)

#define LOGTEST_ERROR_KV(kvs, fmt, ...)                                                            \
    LOGTEST_LOG(::logtest::utils::Level::L_ERROR, LOGTEST_TARGET, kvs, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGTEST_WARN_KV(kvs, fmt, ...)                                                             \
    LOGTEST_LOG(::logtest::utils::Level::L_WARN, LOGTEST_TARGET, kvs, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGTEST_INFO_KV(kvs, fmt, ...)                                                             \
    LOGTEST_LOG(::logtest::utils::Level::L_INFO, LOGTEST_TARGET, kvs, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGTEST_DEBUG_KV(kvs, fmt, ...)                                                            \
    LOGTEST_LOG(::logtest::utils::Level::L_DEBUG, LOGTEST_TARGET, kvs, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGTEST_TRACE_KV(kvs, fmt, ...)                                                            \
    LOGTEST_LOG(::logtest::utils::Level::L_TRACE, LOGTEST_TARGET, kvs, fmt __VA_OPT__(, ) __VA_ARGS__)
