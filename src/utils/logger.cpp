/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the test-facing capture handle.
 ******************************************************************************/
#include "logtest_base.hpp"
#include "utils/log_facade.hpp"
#include "utils/log_sinks/capture_sink.hpp"
#include "utils/logger.hpp"

namespace logtest::utils
{

Logger::Logger(std::shared_ptr<CaptureQueue> queue) noexcept : queue_(std::move(queue)) {}

Logger Logger::start()
{
    CaptureSink::ensure_installed();
    set_max_level(LevelFilter::L_TRACE);
    return Logger(capture_queue());
}

std::optional<Record> Logger::pop()
{
    return queue_->pop();
}

std::size_t Logger::len() const
{
    return queue_->size();
}

bool Logger::is_empty() const
{
    return queue_->empty();
}

void Logger::flush() const
{
    ::logtest::utils::flush();
}

} // namespace logtest::utils
