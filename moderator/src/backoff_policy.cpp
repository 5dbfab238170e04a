
#include "backoff_policy.hpp"
#include <algorithm>
#include <cmath>

BackoffPolicy::BackoffPolicy(int max_retries, std::chrono::milliseconds base_delay, double multiplier)
    : max_retries_(std::max(0, max_retries)),
      base_delay_(base_delay),
      multiplier_(multiplier) {
}

std::chrono::milliseconds BackoffPolicy::delay_for_attempt(int attempt) const {
    if (attempt <= 0 || attempt > max_retries_) {
        return std::chrono::milliseconds(0);
    }

    // No jitter: retries of one message are never fanned out in parallel
    double delay_ms = static_cast<double>(base_delay_.count()) * std::pow(multiplier_, attempt - 1);
    return std::chrono::milliseconds(static_cast<long long>(delay_ms));
}

std::chrono::milliseconds BackoffPolicy::total_delay() const {
    std::chrono::milliseconds total(0);
    for (int attempt = 1; attempt <= max_retries_; ++attempt) {
        total += delay_for_attempt(attempt);
    }
    return total;
}
