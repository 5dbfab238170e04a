
#pragma once
#include <chrono>

// Exponential retry schedule for a single publish call.
// Attempt 0 runs immediately; attempt k >= 1 waits base * multiplier^(k-1).
class BackoffPolicy {
public:
    explicit BackoffPolicy(int max_retries = 3,
                           std::chrono::milliseconds base_delay = std::chrono::milliseconds(1000),
                           double multiplier = 2.0);

    // Total attempts including the first one
    int max_attempts() const { return max_retries_ + 1; }
    int max_retries() const { return max_retries_; }

    // Delay before the given attempt. Attempts past the budget return zero.
    std::chrono::milliseconds delay_for_attempt(int attempt) const;

    // Sum of all delays in a fully exhausted call
    std::chrono::milliseconds total_delay() const;

private:
    int max_retries_;
    std::chrono::milliseconds base_delay_;
    double multiplier_;
};
