#pragma once
/**
 * @file record.hpp
 * @brief An immutable snapshot of one captured log event.
 */
#include <iosfwd>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "logtest_platform.hpp"
#include "utils/log_level.hpp"

namespace logtest::utils
{

/**
 * @class Record
 * @brief The captured payload of a log call: message body, level, target and
 *        the rendered structured fields.
 *
 * Records compare equal when all four parts are equal. The order of
 * `key_values()` is unspecified.
 */
class LOGTEST_EXPORT Record
{
  public:
    using KeyValueMap = std::unordered_map<std::string, std::string>;

    Record(std::string args, Level level, std::string target, KeyValueMap key_values);

    /// The message body, exactly as rendered at the call site.
    const std::string &args() const noexcept { return args_; }

    /// The verbosity level of the message.
    Level level() const noexcept { return level_; }

    /// The origin tag of the message.
    const std::string &target() const noexcept { return target_; }

    /// The structured key-value pairs associated with the message.
    std::vector<std::pair<std::string, std::string>> key_values() const;

    bool operator==(const Record &other) const = default;

  private:
    std::string args_;
    Level level_;
    std::string target_;
    KeyValueMap key_values_;
};

// GoogleTest value printer.
LOGTEST_EXPORT void PrintTo(const Record &rec, std::ostream *os);

} // namespace logtest::utils

template <> struct fmt::formatter<logtest::utils::Record>
{
    constexpr auto parse(fmt::format_parse_context &ctx) -> decltype(ctx.begin())
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const logtest::utils::Record &rec, FormatContext &ctx) const
        -> decltype(ctx.out())
    {
        auto out = fmt::format_to(ctx.out(), "Record {{ level: {}, target: {:?}, args: {:?}",
                                  rec.level(), rec.target(), rec.args());
        const auto kvs = rec.key_values();
        if (!kvs.empty())
        {
            out = fmt::format_to(out, ", key_values: {{");
            bool first = true;
            for (const auto &[key, value] : kvs)
            {
                out = fmt::format_to(out, "{}{}: {}", first ? " " : ", ", key, value);
                first = false;
            }
            out = fmt::format_to(out, " }}");
        }
        return fmt::format_to(out, " }}");
    }
};
