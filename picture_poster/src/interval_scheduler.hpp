#pragma once
#include "post_config.hpp"
#include "retry_backoff.hpp"
#include "timer.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

enum class SchedulerState {
    Idle,
    Armed,
    Firing,
    Stopped
};

enum class FailureOutcome {
    Retrying,
    Exhausted,
    Ignored
};

const char* to_string(SchedulerState state);

// Keeps exactly one deadline armed on the Timer. A fire is one-shot: the
// scheduler stays in Firing until the post outcome is reported through
// notify_posted() or notify_failed().
class IntervalScheduler {
public:
    using Clock = std::chrono::system_clock;
    using DueCallback = std::function<void()>;
    using NowFn = std::function<Clock::time_point()>;

    IntervalScheduler(Timer& timer, RetryPolicy retry_policy = RetryPolicy{}, NowFn now = nullptr);

    bool initialize(const PostConfig& config, DueCallback on_due);
    bool reschedule(std::chrono::seconds new_interval);
    void notify_posted(Clock::time_point post_time);
    FailureOutcome notify_failed(const std::string& reason);
    void cancel();

    SchedulerState state() const;
    bool is_firing() const;
    std::optional<Clock::time_point> next_due() const;
    std::optional<Clock::time_point> anchor() const;
    std::chrono::seconds interval() const;
    int retry_attempts() const;

private:
    void arm_locked(Clock::time_point due);
    void on_timer(uint64_t generation);
    void apply_pending_interval_locked();
    Clock::time_point next_grid_point_locked(Clock::time_point now) const;

    Timer& timer_;
    NowFn now_;
    RetryBackoff backoff_;

    mutable std::mutex mutex_;
    SchedulerState state_ = SchedulerState::Idle;
    std::chrono::seconds interval_{0};
    std::optional<std::chrono::seconds> pending_interval_;
    std::optional<Clock::time_point> anchor_;
    std::optional<Clock::time_point> due_;
    uint64_t generation_ = 0;
    DueCallback on_due_;
};
