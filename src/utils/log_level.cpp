#include "utils/log_level.hpp"

#include <ostream>

namespace logtest::utils
{

std::string_view to_string(Level lvl) noexcept
{
    switch (lvl)
    {
    case Level::L_ERROR:
        return "ERROR";
    case Level::L_WARN:
        return "WARN";
    case Level::L_INFO:
        return "INFO";
    case Level::L_DEBUG:
        return "DEBUG";
    case Level::L_TRACE:
        return "TRACE";
    }
    return "UNK";
}

std::string_view to_string(LevelFilter filter) noexcept
{
    if (filter == LevelFilter::L_OFF)
        return "OFF";
    return to_string(static_cast<Level>(static_cast<int>(filter)));
}

void PrintTo(Level lvl, std::ostream *os)
{
    *os << to_string(lvl);
}

void PrintTo(LevelFilter filter, std::ostream *os)
{
    *os << to_string(filter);
}

} // namespace logtest::utils
