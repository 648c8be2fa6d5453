// Tools for formatting strings
#pragma once
#include <string_view>

#include <fmt/format.h>

namespace logtest::format_tools
{

/**
 * @brief Views the contents of a `fmt::memory_buffer` without copying.
 */
inline std::string_view buffer_view(const fmt::memory_buffer &mb) noexcept
{
    return {mb.data(), mb.size()};
}

/**
 * @brief Extracts the filename from a full path at compile time.
 * @param file_path A string_view of the full path.
 * @return A string_view of just the filename portion of the path.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto last_slash = file_path.find_last_of('/');
    const auto last_backslash = file_path.find_last_of('\\');

    const std::string_view::size_type last_separator_pos = [&]()
    {
        if (last_slash == std::string_view::npos)
        {
            return last_backslash;
        }
        if (last_backslash == std::string_view::npos)
        {
            return last_slash;
        }
        return last_slash > last_backslash ? last_slash : last_backslash;
    }();

    // If a separator was found, return the part after it; otherwise return the original string
    if (last_separator_pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(last_separator_pos + 1);
}

} // namespace logtest::format_tools
