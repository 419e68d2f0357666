#include "retry_backoff.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

RetryBackoff::RetryBackoff(RetryPolicy policy) : policy_(policy) {}

std::chrono::milliseconds RetryBackoff::record_failure() {
    failure_count_++;
    return calculate_delay(failure_count_);
}

void RetryBackoff::reset() {
    failure_count_ = 0;
}

std::chrono::milliseconds RetryBackoff::calculate_delay(int failure_count) const {
    if (failure_count <= 0) {
        return std::chrono::milliseconds(0);
    }

    double base_seconds = static_cast<double>(policy_.base_delay.count());
    double max_seconds = static_cast<double>(policy_.max_delay.count());

    double delay_seconds = base_seconds * std::pow(policy_.multiplier, failure_count - 1);
    delay_seconds = std::min(delay_seconds, max_seconds);
    delay_seconds = util::random_jitter(delay_seconds, policy_.jitter_factor);
    delay_seconds = std::max(delay_seconds, static_cast<double>(kMinDelay.count()));

    return std::chrono::milliseconds(static_cast<int64_t>(delay_seconds * 1000));
}
