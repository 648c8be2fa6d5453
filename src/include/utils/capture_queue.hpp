#pragma once
/**
 * @file capture_queue.hpp
 * @brief The process-wide FIFO of captured records.
 *
 * **Thread Safety**
 * - Every member function takes the queue mutex for the duration of the single
 *   operation and never calls out while holding it.
 * - Records are totally ordered by the order in which `push()` acquires the
 *   lock. Records pushed by one thread keep that thread's order; interleaving
 *   between threads is unspecified.
 *
 * The queue is unbounded. Nothing is ever evicted.
 */
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "logtest_platform.hpp"
#include "utils/record.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace logtest::utils
{

class LOGTEST_EXPORT CaptureQueue
{
  public:
    CaptureQueue() = default;
    CaptureQueue(const CaptureQueue &) = delete;
    CaptureQueue &operator=(const CaptureQueue &) = delete;

    /// Appends a record at the back.
    void push(Record &&rec);

    /// Removes and returns the oldest record, or std::nullopt when empty.
    [[nodiscard]] std::optional<Record> pop();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;

  private:
    mutable std::mutex mutex_;
    std::deque<Record> records_;
};

/**
 * @brief The shared capture queue, created on first access.
 *
 * Every caller gets a reference to the same queue; it is released only after
 * the last holder (sink or handle) goes away at process exit.
 */
LOGTEST_EXPORT std::shared_ptr<CaptureQueue> capture_queue();

} // namespace logtest::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
