#include "logtest_base.hpp"
#include "utils/log_sinks/sink.hpp"

namespace logtest::utils
{

void Value::render_to(fmt::memory_buffer &out) const
{
    auto it = std::back_inserter(out);
    switch (kind_)
    {
    case Kind::Text:
        fmt::format_to(it, "{:?}", text_);
        return;
    case Kind::Char:
        fmt::format_to(it, "{:?}", char_);
        return;
    case Kind::Bool:
        fmt::format_to(it, "{}", bool_);
        return;
    case Kind::Object:
        object_->render_to(out);
        return;
    }
}

std::string Value::to_string() const
{
    fmt::memory_buffer mb;
    render_to(mb);
    return fmt::to_string(mb);
}

} // namespace logtest::utils
