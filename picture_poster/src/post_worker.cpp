#include "post_worker.hpp"
#include <spdlog/spdlog.h>

PostWorker::~PostWorker() {
    stop();
}

void PostWorker::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    worker_thread_ = std::thread(&PostWorker::worker_loop, this);
}

void PostWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
        if (!jobs_.empty()) {
            spdlog::warn("Dropping {} queued post job(s) on shutdown", jobs_.size());
            std::queue<Job>().swap(jobs_);
        }
    }
    queue_cv_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    idle_cv_.notify_all();
}

bool PostWorker::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            spdlog::warn("Post worker is not running, job rejected");
            return false;
        }
        jobs_.push(std::move(job));
    }
    queue_cv_.notify_one();
    return true;
}

void PostWorker::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return (jobs_.empty() && !busy_) || !running_; });
}

void PostWorker::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] { return !jobs_.empty() || !running_; });
            if (!running_) break;

            job = std::move(jobs_.front());
            jobs_.pop();
            busy_ = true;
        }

        try {
            job();
        } catch (const std::exception& e) {
            spdlog::error("Post job failed: {}", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}
