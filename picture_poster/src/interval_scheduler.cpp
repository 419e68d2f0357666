#include "interval_scheduler.hpp"
#include "duration.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

const char* to_string(SchedulerState state) {
    switch (state) {
        case SchedulerState::Idle: return "idle";
        case SchedulerState::Armed: return "armed";
        case SchedulerState::Firing: return "firing";
        case SchedulerState::Stopped: return "stopped";
    }
    return "unknown";
}

IntervalScheduler::IntervalScheduler(Timer& timer, RetryPolicy retry_policy, NowFn now)
    : timer_(timer),
      now_(now ? std::move(now) : NowFn([] { return Clock::now(); })),
      backoff_(retry_policy) {}

bool IntervalScheduler::initialize(const PostConfig& config, DueCallback on_due) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != SchedulerState::Idle) {
        spdlog::warn("Scheduler already initialized (state: {})", to_string(state_));
        return false;
    }

    if (config.post_interval.count() <= 0) {
        spdlog::error("Refusing to schedule with non-positive interval {}s", config.post_interval.count());
        return false;
    }

    on_due_ = std::move(on_due);
    interval_ = config.post_interval;

    auto now = now_();
    anchor_ = config.last_post_time.value_or(now);
    auto due = *anchor_ + interval_;

    if (due <= now) {
        spdlog::info("Next post was due at {}, posting now", util::format_local_time(due));
        due = now;
    } else {
        auto delay = std::chrono::duration_cast<std::chrono::seconds>(due - now);
        spdlog::info("Scheduling next post in {}", format_interval(delay));
    }

    arm_locked(due);
    return true;
}

bool IntervalScheduler::reschedule(std::chrono::seconds new_interval) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (new_interval.count() <= 0) {
        spdlog::error("Refusing to reschedule with non-positive interval {}s", new_interval.count());
        return false;
    }

    if (state_ == SchedulerState::Idle || state_ == SchedulerState::Stopped) {
        spdlog::warn("Cannot reschedule, scheduler is {}", to_string(state_));
        return false;
    }

    if (state_ == SchedulerState::Firing) {
        // Applied once the in-flight post reports its outcome.
        pending_interval_ = new_interval;
        spdlog::info("Post in flight, interval {} will apply to the next cycle", format_interval(new_interval));
        return true;
    }

    interval_ = new_interval;
    pending_interval_.reset();
    backoff_.reset();

    auto now = now_();
    auto due = *anchor_ + interval_;
    if (due <= now) {
        due = now;
    }

    spdlog::info("Rescheduled with interval {}, next post at {}",
                 format_interval(interval_), util::format_local_time(due));
    arm_locked(due);
    return true;
}

void IntervalScheduler::notify_posted(Clock::time_point post_time) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == SchedulerState::Idle || state_ == SchedulerState::Stopped) {
        return;
    }

    apply_pending_interval_locked();
    backoff_.reset();

    auto due = post_time + interval_;
    if (state_ == SchedulerState::Armed && anchor_ == post_time && due_ == due) {
        spdlog::debug("Post at {} already accounted for", util::format_local_time(post_time));
        return;
    }

    anchor_ = post_time;
    spdlog::info("Next post at {}", util::format_local_time(due));
    arm_locked(due);
}

FailureOutcome IntervalScheduler::notify_failed(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != SchedulerState::Firing) {
        return FailureOutcome::Ignored;
    }

    apply_pending_interval_locked();

    auto delay = backoff_.record_failure();
    auto now = now_();

    if (!backoff_.exhausted()) {
        spdlog::warn("Scheduled post failed ({}), retry {}/{} in {}ms",
                     reason, backoff_.failure_count(), backoff_.policy().max_attempts, delay.count());
        arm_locked(now + delay);
        return FailureOutcome::Retrying;
    }

    int attempts = backoff_.failure_count();
    backoff_.reset();
    auto due = next_grid_point_locked(now);
    spdlog::error("Scheduled post failed after {} attempts ({}), next regular post at {}",
                  attempts, reason, util::format_local_time(due));
    arm_locked(due);
    return FailureOutcome::Exhausted;
}

void IntervalScheduler::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == SchedulerState::Stopped) {
        return;
    }

    state_ = SchedulerState::Stopped;
    generation_++;
    due_.reset();
    pending_interval_.reset();
    timer_.cancel();
    spdlog::info("Scheduler stopped");
}

SchedulerState IntervalScheduler::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool IntervalScheduler::is_firing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SchedulerState::Firing;
}

std::optional<IntervalScheduler::Clock::time_point> IntervalScheduler::next_due() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return due_;
}

std::optional<IntervalScheduler::Clock::time_point> IntervalScheduler::anchor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return anchor_;
}

std::chrono::seconds IntervalScheduler::interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_interval_.value_or(interval_);
}

int IntervalScheduler::retry_attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backoff_.failure_count();
}

void IntervalScheduler::arm_locked(Clock::time_point due) {
    uint64_t generation = ++generation_;
    due_ = due;
    state_ = SchedulerState::Armed;
    timer_.arm(due, [this, generation] { on_timer(generation); });
}

void IntervalScheduler::on_timer(uint64_t generation) {
    DueCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || state_ != SchedulerState::Armed) {
            spdlog::debug("Ignoring stale timer fire (generation {})", generation);
            return;
        }
        state_ = SchedulerState::Firing;
        due_.reset();
        callback = on_due_;
    }

    if (callback) {
        callback();
    }
}

void IntervalScheduler::apply_pending_interval_locked() {
    if (pending_interval_) {
        interval_ = *pending_interval_;
        pending_interval_.reset();
        spdlog::info("Applied new interval {}", format_interval(interval_));
    }
}

IntervalScheduler::Clock::time_point IntervalScheduler::next_grid_point_locked(Clock::time_point now) const {
    auto anchor = anchor_.value_or(now);
    auto due = anchor + interval_;
    if (due > now) {
        return due;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - anchor);
    auto cycles = elapsed / interval_ + 1;
    return anchor + interval_ * cycles;
}
