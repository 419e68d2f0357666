#pragma once
#include <chrono>

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::seconds base_delay{30};
    std::chrono::seconds max_delay{600};
    double multiplier = 2.0;
    double jitter_factor = 0.1;
};

// Capped exponential backoff for scheduled post retries. Not thread-safe;
// IntervalScheduler calls it under its own lock.
class RetryBackoff {
public:
    static constexpr std::chrono::seconds kMinDelay{5};

    explicit RetryBackoff(RetryPolicy policy = RetryPolicy{});

    // Records a failure and returns the delay before the next attempt.
    std::chrono::milliseconds record_failure();
    void reset();

    int failure_count() const { return failure_count_; }
    bool exhausted() const { return failure_count_ > policy_.max_attempts; }
    const RetryPolicy& policy() const { return policy_; }

private:
    std::chrono::milliseconds calculate_delay(int failure_count) const;

    RetryPolicy policy_;
    int failure_count_ = 0;
};
