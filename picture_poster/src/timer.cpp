#include "timer.hpp"
#include <spdlog/spdlog.h>

ThreadTimer::ThreadTimer() : running_(true) {
    timer_thread_ = std::thread(&ThreadTimer::timer_loop, this);
}

ThreadTimer::~ThreadTimer() {
    stop();
}

void ThreadTimer::arm(std::chrono::system_clock::time_point due, Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        due_ = due;
        callback_ = std::move(callback);
    }
    cv_.notify_one();
}

void ThreadTimer::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        due_.reset();
        callback_ = nullptr;
    }
    cv_.notify_one();
}

void ThreadTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        due_.reset();
        callback_ = nullptr;
    }
    cv_.notify_one();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

void ThreadTimer::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (!due_) {
            cv_.wait(lock, [this] { return !running_ || due_.has_value(); });
            continue;
        }

        auto due = *due_;
        if (std::chrono::system_clock::now() < due) {
            // Woken early by arm/cancel/stop or a spurious wakeup; re-evaluate.
            cv_.wait_until(lock, due);
            continue;
        }

        Callback callback = std::move(callback_);
        callback_ = nullptr;
        due_.reset();

        lock.unlock();
        try {
            if (callback) {
                callback();
            }
        } catch (const std::exception& e) {
            spdlog::error("Timer callback failed: {}", e.what());
        }
        lock.lock();
    }
}
