// tests/test_framework/probe_sink.h
#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "utils/log_sinks/sink.hpp"

namespace logtest::tests::helper
{

/**
 * @brief A facade sink that snapshots the last event it received.
 *
 * `min_level` narrows what `enabled()` accepts on top of the facade's own
 * threshold; `L_TRACE` accepts everything.
 */
struct ProbeSink : public ::logtest::utils::LogSink
{
    std::atomic<int> count{0};
    std::atomic<int> flushes{0};
    mutable std::atomic<int> enabled_checks{0};
    ::logtest::utils::LevelFilter min_level{::logtest::utils::LevelFilter::L_TRACE};

    // last values captured (copied in log)
    mutable std::mutex mutex;
    ::logtest::utils::Level last_level{::logtest::utils::Level::L_INFO};
    std::string last_target;
    std::string last_args;
    std::vector<std::pair<std::string, std::string>> last_kvs;

    bool enabled(const ::logtest::utils::Metadata &metadata) const noexcept override
    {
        enabled_checks++;
        return ::logtest::utils::level_passes(metadata.level, min_level);
    }

    void log(const ::logtest::utils::Event &event) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        last_level = event.level();
        last_target = std::string(event.target());
        last_args = std::string(event.args());
        last_kvs.clear();
        for (const auto &kv : event.key_values())
        {
            last_kvs.emplace_back(std::string(kv.key), kv.value.to_string());
        }
        count++;
    }

    void flush() override { flushes++; }

    std::string description() const override { return "ProbeSink"; }
};

} // namespace logtest::tests::helper
