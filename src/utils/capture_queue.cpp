#include "utils/capture_queue.hpp"

namespace logtest::utils
{

void CaptureQueue::push(Record &&rec)
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(rec));
}

std::optional<Record> CaptureQueue::pop()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.empty())
        return std::nullopt;
    std::optional<Record> front(std::move(records_.front()));
    records_.pop_front();
    return front;
}

std::size_t CaptureQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

bool CaptureQueue::empty() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.empty();
}

std::shared_ptr<CaptureQueue> capture_queue()
{
    // Function-local static initialization is thread-safe since C++11.
    static const std::shared_ptr<CaptureQueue> queue = std::make_shared<CaptureQueue>();
    return queue;
}

} // namespace logtest::utils
