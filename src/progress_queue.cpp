#include "progress_queue.hpp"

#include <algorithm>

namespace refrax {

ProgressQueue::ProgressQueue(std::size_t capacity)
    : cap_(std::max<std::size_t>(1, capacity)) {}

void ProgressQueue::push(const ProgressEvent& ev)
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (q_.size() >= cap_) {
        q_.pop_front();
        ++dropped_;
    }
    q_.push_back(ev);
}

std::vector<ProgressEvent> ProgressQueue::drain()
{
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<ProgressEvent> out(q_.begin(), q_.end());
    q_.clear();
    return out;
}

std::size_t ProgressQueue::dropped() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return dropped_;
}

std::size_t ProgressQueue::size() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return q_.size();
}

ProgressSink ProgressQueue::sink()
{
    return [this](const ProgressEvent& ev) { push(ev); };
}

}  // namespace refrax
