#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

// Single-slot one-shot timer. arm() replaces whatever deadline is pending.
class Timer {
public:
    using Callback = std::function<void()>;

    virtual ~Timer() = default;

    virtual void arm(std::chrono::system_clock::time_point due, Callback callback) = 0;
    virtual void cancel() = 0;
};

// Runs callbacks on its own thread.
class ThreadTimer : public Timer {
public:
    ThreadTimer();
    ~ThreadTimer() override;

    void arm(std::chrono::system_clock::time_point due, Callback callback) override;
    void cancel() override;
    void stop();

private:
    void timer_loop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<std::chrono::system_clock::time_point> due_;
    Callback callback_;
    bool running_;
    std::thread timer_thread_;
};
