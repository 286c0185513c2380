/* ──────────────────────────────────────────────────────────────
   progress_queue.hpp  –  bounded drop-oldest buffer a UI can poll
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "common.hpp"

namespace refrax {

class ProgressQueue {
public:
    explicit ProgressQueue(std::size_t capacity = 256);

    /* never blocks on the reader; the oldest event goes when full */
    void push(const ProgressEvent& ev);
    std::vector<ProgressEvent> drain();

    std::size_t dropped() const;
    std::size_t size() const;

    /* sink that feeds this queue; the queue must outlive it */
    ProgressSink sink();

private:
    std::size_t               cap_;
    std::size_t               dropped_ = 0;
    std::deque<ProgressEvent> q_;
    mutable std::mutex        mtx_;
};

}  // namespace refrax
