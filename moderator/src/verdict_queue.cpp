#include "verdict_queue.hpp"
#include <stdexcept>

VerdictQueue::VerdictQueue(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Verdict queue capacity must be at least 1");
    }
}

bool VerdictQueue::push(VerdictRequest request) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
    if (closed_) return false;

    items_.push_back(std::move(request));
    not_empty_.notify_one();
    return true;
}

bool VerdictQueue::pop(VerdictRequest& request) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
    // Drain what was already accepted before reporting closed
    if (items_.empty()) return false;

    request = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
    return true;
}

void VerdictQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

size_t VerdictQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}
