/*******************************************************************************
 * @file log_facade.cpp
 * @brief Implementation of the install-once sink slot and level threshold.
 ******************************************************************************/
#include <atomic>

#include "logtest_base.hpp"
#include "utils/log_facade.hpp"

namespace logtest::utils
{

// Represents the state of the global sink slot.
enum class SinkState
{
    Uninitialized,
    Initializing,
    Initialized
};

static std::atomic<SinkState> g_sink_state{SinkState::Uninitialized};
static std::atomic<LogSink *> g_sink{nullptr};
static std::atomic<int> g_max_level{static_cast<int>(LevelFilter::L_OFF)};

namespace
{
// Routed to before a sink is installed.
class NopSink final : public LogSink
{
  public:
    bool enabled(const Metadata &) const noexcept override { return false; }
    void log(const Event &) override {}
    void flush() override {}
    std::string description() const override { return "Nop"; }
};

NopSink &nop_sink() noexcept
{
    static NopSink instance;
    return instance;
}
} // anonymous namespace

bool try_set_sink(LogSink &sink) noexcept
{
    SinkState expected = SinkState::Uninitialized;
    if (!g_sink_state.compare_exchange_strong(expected, SinkState::Initializing,
                                              std::memory_order_acq_rel))
    {
        LOGTEST_DBG("try_set_sink: a log sink is already installed; rejecting {}",
                    sink.description());
        return false;
    }
    g_sink.store(&sink, std::memory_order_release);
    g_sink_state.store(SinkState::Initialized, std::memory_order_release);
    LOGTEST_DBG("try_set_sink: installed {}", sink.description());
    return true;
}

bool sink_installed() noexcept
{
    return g_sink_state.load(std::memory_order_acquire) == SinkState::Initialized;
}

LogSink &sink() noexcept
{
    if (!sink_installed())
        return nop_sink();
    return *g_sink.load(std::memory_order_acquire);
}

void set_max_level(LevelFilter filter) noexcept
{
    g_max_level.store(static_cast<int>(filter), std::memory_order_relaxed);
}

LevelFilter max_level() noexcept
{
    return static_cast<LevelFilter>(g_max_level.load(std::memory_order_relaxed));
}

void flush()
{
    sink().flush();
}

bool log_enabled(Level lvl, std::string_view target) noexcept
{
    if (!level_passes(lvl, max_level()))
        return false;
    return sink().enabled(Metadata{lvl, target});
}

void dispatch(const Metadata &metadata, std::string_view args,
              const KeyValues &key_values) noexcept
{
    sink().log(Event(metadata, args, key_values));
}

} // namespace logtest::utils
