#pragma once

#include "types.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// Bounded hand-off between the verdict consumer and the worker pool.
// push() blocks while the queue is full; close() releases every waiter.
class VerdictQueue {
public:
    explicit VerdictQueue(size_t capacity);

    // False once the queue is closed; the request was not queued.
    bool push(VerdictRequest request);

    // Blocks until a request is available. False once closed and drained.
    bool pop(VerdictRequest& request);

    void close();

    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<VerdictRequest> items_;
    bool closed_ = false;
};
