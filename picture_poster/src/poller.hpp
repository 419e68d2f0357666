#pragma once
#include "retry_backoff.hpp"
#include "telegram_client.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

// Long-polls getUpdates and hands each update to the bot. Network
// errors back off exponentially so a Telegram outage does not spin the loop.
class TelegramPoller {
public:
    using UpdateHandler = std::function<void(const TelegramUpdate&)>;

    TelegramPoller(TelegramClient& client, int poll_timeout_seconds);
    ~TelegramPoller();

    void start(UpdateHandler update_handler);
    void stop();

    int64_t last_update_id() const { return last_update_id_; }

private:
    void polling_loop(UpdateHandler update_handler);
    void dispatch(const std::vector<TelegramUpdate>& updates, const UpdateHandler& update_handler);
    // Returns false when stop() interrupted the pause.
    bool pause(std::chrono::milliseconds delay);

    TelegramClient& client_;
    int poll_timeout_seconds_;
    RetryBackoff error_backoff_;
    std::thread poller_thread_;
    std::atomic<bool> running_{false};
    std::atomic<int64_t> last_update_id_{0};
    std::mutex pause_mutex_;
    std::condition_variable pause_cv_;
};
