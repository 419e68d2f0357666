#include "poller.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace {

RetryPolicy polling_error_policy() {
    RetryPolicy policy;
    policy.base_delay = std::chrono::seconds(5);
    policy.max_delay = std::chrono::seconds(60);
    return policy;
}

}

TelegramPoller::TelegramPoller(TelegramClient& client, int poll_timeout_seconds)
    : client_(client),
      poll_timeout_seconds_(poll_timeout_seconds),
      error_backoff_(polling_error_policy()) {}

TelegramPoller::~TelegramPoller() {
    stop();
}

void TelegramPoller::start(UpdateHandler update_handler) {
    if (running_.exchange(true)) {
        return;
    }
    poller_thread_ = std::thread(&TelegramPoller::polling_loop, this, std::move(update_handler));
    spdlog::info("Polling for admin commands (timeout {}s)", poll_timeout_seconds_);
}

void TelegramPoller::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    pause_cv_.notify_all();
    // An in-flight getUpdates returns within the poll timeout.
    if (poller_thread_.joinable()) {
        poller_thread_.join();
    }
    spdlog::info("Stopped polling, last update id {}", last_update_id_.load());
}

void TelegramPoller::polling_loop(UpdateHandler update_handler) {
    while (running_) {
        std::vector<TelegramUpdate> updates;
        try {
            updates = client_.get_updates(last_update_id_ + 1, poll_timeout_seconds_);
        } catch (const std::exception& e) {
            auto delay = error_backoff_.record_failure();
            spdlog::error("getUpdates failed ({} in a row), retrying in {}ms: {}",
                          error_backoff_.failure_count(), delay.count(), e.what());
            if (!pause(delay)) {
                break;
            }
            continue;
        }

        if (error_backoff_.failure_count() > 0) {
            spdlog::info("Polling recovered after {} failure(s)", error_backoff_.failure_count());
            error_backoff_.reset();
        }

        if (updates.empty()) {
            pause(std::chrono::milliseconds(100));
            continue;
        }

        dispatch(updates, update_handler);
    }
}

void TelegramPoller::dispatch(const std::vector<TelegramUpdate>& updates, const UpdateHandler& update_handler) {
    for (const auto& update : updates) {
        // Acknowledge before handling so a crashing command is not redelivered forever.
        if (update.update_id > last_update_id_) {
            last_update_id_ = update.update_id;
        }

        if (update.message.from.id == 0) {
            spdlog::debug("Skipping update {} without a sender", update.update_id);
            continue;
        }

        try {
            update_handler(update);
        } catch (const std::exception& e) {
            spdlog::error("Error handling update {} from {}: {}", update.update_id, update.message.from.id, e.what());
        }
    }
}

bool TelegramPoller::pause(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(pause_mutex_);
    return !pause_cv_.wait_for(lock, delay, [this] { return !running_.load(); });
}
