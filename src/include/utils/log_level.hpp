#pragma once
/**
 * @file log_level.hpp
 * @brief Severity levels and level filters for the logging facade.
 *
 * Levels are ordered from least to most verbose:
 * `L_ERROR < L_WARN < L_INFO < L_DEBUG < L_TRACE`. A `LevelFilter` is a ceiling:
 * a level passes when it is not more verbose than the filter. `L_OFF` lets
 * nothing through.
 */
#include <iosfwd>
#include <string_view>

#include <fmt/format.h>

#include "logtest_platform.hpp"

namespace logtest::utils
{

enum class Level : int
{
    L_ERROR = 1,
    L_WARN = 2,
    L_INFO = 3,
    L_DEBUG = 4,
    L_TRACE = 5,
};

enum class LevelFilter : int
{
    L_OFF = 0,
    L_ERROR = 1,
    L_WARN = 2,
    L_INFO = 3,
    L_DEBUG = 4,
    L_TRACE = 5,
};

/// True if a record at `lvl` passes `filter`.
constexpr bool level_passes(Level lvl, LevelFilter filter) noexcept
{
    return static_cast<int>(lvl) <= static_cast<int>(filter);
}

/// The filter that lets exactly `lvl` and everything less verbose through.
constexpr LevelFilter to_filter(Level lvl) noexcept
{
    return static_cast<LevelFilter>(static_cast<int>(lvl));
}

/// Upper-case name of a level: "ERROR", "WARN", "INFO", "DEBUG", "TRACE".
LOGTEST_EXPORT std::string_view to_string(Level lvl) noexcept;

/// Upper-case name of a filter; "OFF" for `L_OFF`.
LOGTEST_EXPORT std::string_view to_string(LevelFilter filter) noexcept;

// GoogleTest value printers.
LOGTEST_EXPORT void PrintTo(Level lvl, std::ostream *os);
LOGTEST_EXPORT void PrintTo(LevelFilter filter, std::ostream *os);

} // namespace logtest::utils

template <> struct fmt::formatter<logtest::utils::Level> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(logtest::utils::Level lvl, FormatContext &ctx) const -> decltype(ctx.out())
    {
        return fmt::formatter<std::string_view>::format(logtest::utils::to_string(lvl), ctx);
    }
};

template <> struct fmt::formatter<logtest::utils::LevelFilter> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(logtest::utils::LevelFilter filter, FormatContext &ctx) const
        -> decltype(ctx.out())
    {
        return fmt::formatter<std::string_view>::format(logtest::utils::to_string(filter), ctx);
    }
};
