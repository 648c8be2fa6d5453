#pragma once
/**
 * @file capture_sink.hpp
 * @brief The sink that records every event into the shared capture queue.
 *
 * There is one CaptureSink per process. It accepts every level and target,
 * performs no I/O and buffers nothing outside the queue.
 *
 * Installation has two entry points:
 * - `install()` is the raw registration with the facade. It panics if any sink
 *   (this one included) is already installed.
 * - `ensure_installed()` runs `install()` the first time it is called and does
 *   nothing afterwards. `Logger::start()` uses it.
 */
#include <memory>
#include <string>

#include "utils/capture_queue.hpp"
#include "utils/log_sinks/sink.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace logtest::utils
{

class LOGTEST_EXPORT CaptureSink final : public LogSink
{
  public:
    /// The process-wide capture sink.
    static CaptureSink &instance();

    /**
     * @brief Registers the capture sink as the facade's log destination.
     * @note Panics (does not return) if a sink is already installed.
     */
    static void install();

    /// Calls `install()` exactly once per process; later calls are no-ops.
    static void ensure_installed();

    CaptureSink(const CaptureSink &) = delete;
    CaptureSink &operator=(const CaptureSink &) = delete;

    bool enabled(const Metadata &metadata) const noexcept override;
    void log(const Event &event) override;
    void flush() override;
    std::string description() const override;

  private:
    explicit CaptureSink(std::shared_ptr<CaptureQueue> queue);

    std::shared_ptr<CaptureQueue> queue_;
};

} // namespace logtest::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
