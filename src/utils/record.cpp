#include <ostream>

#include "utils/record.hpp"

namespace logtest::utils
{

Record::Record(std::string args, Level level, std::string target, KeyValueMap key_values)
    : args_(std::move(args)), level_(level), target_(std::move(target)),
      key_values_(std::move(key_values))
{
}

std::vector<std::pair<std::string, std::string>> Record::key_values() const
{
    return {key_values_.begin(), key_values_.end()};
}

void PrintTo(const Record &rec, std::ostream *os)
{
    *os << fmt::format("{}", rec);
}

} // namespace logtest::utils
