#include <mutex>
#include <stdexcept>

#include "logtest_base.hpp"
#include "utils/log_facade.hpp"
#include "utils/log_sinks/capture_sink.hpp"

namespace logtest::utils
{

CaptureSink::CaptureSink(std::shared_ptr<CaptureQueue> queue) : queue_(std::move(queue)) {}

CaptureSink &CaptureSink::instance()
{
    // Never destroyed: worker threads may still log while static destructors run.
    static CaptureSink *instance = new CaptureSink(capture_queue());
    return *instance;
}

void CaptureSink::install()
{
    CaptureSink &capture = instance();
    if (!try_set_sink(capture))
    {
        LOGTEST_PANIC("CaptureSink::install: a log sink is already installed ({}). The capture "
                      "sink can be installed only once per process.",
                      sink().description());
    }
    LOGTEST_DBG("CaptureSink installed.");
}

void CaptureSink::ensure_installed()
{
    static std::once_flag once;
    std::call_once(once,
                   []
                   {
                       // An explicit install() beforehand already did the work.
                       if (sink_installed() && &sink() == &instance())
                           return;
                       install();
                   });
}

bool CaptureSink::enabled(const Metadata &) const noexcept
{
    return true;
}

void CaptureSink::log(const Event &event)
{
    // Render outside the queue lock: a value's formatter may itself log.
    Record::KeyValueMap key_values;
    try
    {
        for (const auto &kv : event.key_values())
        {
            key_values.insert_or_assign(kv.key, kv.value.to_string());
        }
    }
    catch (const std::exception &e)
    {
        LOGTEST_PANIC("CaptureSink: could not render key-value pairs of a '{}' event from '{}': {}",
                      event.level(), event.target(), e.what());
    }
    catch (...)
    {
        LOGTEST_PANIC("CaptureSink: could not render key-value pairs of a '{}' event from '{}': "
                      "unknown exception",
                      event.level(), event.target());
    }

    queue_->push(Record(std::string(event.args()), event.level(), std::string(event.target()),
                        std::move(key_values)));
}

void CaptureSink::flush() {}

std::string CaptureSink::description() const
{
    return "CaptureSink";
}

} // namespace logtest::utils
