/*******************************************************************************
 * @file logger.hpp
 * @brief Test-facing handle over the captured log records.
 *
 * **Design**
 * 1.  **One queue per process**: every record logged through the facade after
 *     `Logger::start()` lands in one shared FIFO. All handles are views onto
 *     that same queue; popping through one handle removes the record for all.
 * 2.  **Install once, start many times**: the first `start()` installs the
 *     capture sink and lowers the facade threshold to `L_TRACE`. Later calls
 *     only build a new handle.
 * 3.  **Synchronous**: `pop()`, `len()` and `is_empty()` only wait for the
 *     queue mutex, never for other threads' logging.
 *
 * **Constraint**
 * The queue is shared by everything in the process. If several test routines
 * run concurrently in one process they will see and consume each other's
 * records. Drive all log assertions of a test binary from one routine at a
 * time (GoogleTest runs tests sequentially by default; `gtest_discover_tests`
 * gives every test its own process).
 *
 * **Usage**
 * ```cpp
 * #include "logtest.hpp"
 *
 * auto logger = logtest::start();
 * LOGTEST_INFO("hello");
 * LOGTEST_INFO("world");
 * EXPECT_EQ(logger.pop()->args(), "hello");
 * EXPECT_EQ(logger.pop()->args(), "world");
 * EXPECT_TRUE(logger.is_empty());
 * ```
 ******************************************************************************/
#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>

#include "logtest_platform.hpp"
#include "utils/capture_queue.hpp"
#include "utils/record.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace logtest::utils
{

class LOGTEST_EXPORT Logger
{
  public:
    /**
     * @brief Single-pass input iterator that pops records until the queue is empty.
     *
     * Advancing it is a `pop()`. It compares equal to `end()` once a pop
     * finds the queue empty.
     */
    class iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Record;
        using difference_type = std::ptrdiff_t;
        using pointer = const Record *;
        using reference = const Record &;

        iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator &operator++()
        {
            current_ = owner_->pop();
            return *this;
        }
        void operator++(int) { ++*this; }

        friend bool operator==(const iterator &it, std::default_sentinel_t) noexcept
        {
            return !it.current_.has_value();
        }

      private:
        friend class Logger;
        explicit iterator(Logger *owner) : owner_(owner), current_(owner->pop()) {}

        Logger *owner_{nullptr};
        std::optional<Record> current_;
    };

    /**
     * @brief Starts capturing and returns a handle onto the capture queue.
     *
     * The first call in the process installs the capture sink and sets the
     * facade threshold to `LevelFilter::L_TRACE`. Safe to call repeatedly.
     * @note Panics if a different sink was installed into the facade first.
     */
    static Logger start();

    /// Removes and returns the oldest captured record, or std::nullopt if none remain.
    [[nodiscard]] std::optional<Record> pop();

    /// Number of records currently queued.
    [[nodiscard]] std::size_t len() const;

    /// Returns `true` if no records are queued.
    [[nodiscard]] bool is_empty() const;

    /// Flushes the facade's sink. The capture queue itself never buffers.
    void flush() const;

    iterator begin() { return iterator(this); }
    std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

  private:
    explicit Logger(std::shared_ptr<CaptureQueue> queue) noexcept;

    std::shared_ptr<CaptureQueue> queue_;
};

/// Starts capturing and returns a handle onto the capture queue.
inline Logger start()
{
    return Logger::start();
}

} // namespace logtest::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
