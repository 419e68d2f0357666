#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

// Runs post and download jobs one at a time on a background thread so the
// command loop never waits on network I/O.
class PostWorker {
public:
    using Job = std::function<void()>;

    PostWorker() = default;
    ~PostWorker();

    void start();
    // Finishes the running job, drops queued ones, joins the thread.
    void stop();
    bool submit(Job job);
    // Blocks until the queue is empty and no job is running.
    void wait_idle();

private:
    void worker_loop();

    std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::queue<Job> jobs_;
    bool running_ = false;
    bool busy_ = false;
    std::thread worker_thread_;
};
