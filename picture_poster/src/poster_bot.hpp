#pragma once
#include "auth.hpp"
#include "bot_transport.hpp"
#include "config.hpp"
#include "config_store.hpp"
#include "interval_scheduler.hpp"
#include "parser.hpp"
#include "post_coordinator.hpp"
#include "post_worker.hpp"
#include "telegram_client.hpp"
#include "timer.hpp"
#include <chrono>
#include <functional>
#include <string>

// Admin command handling plus the scheduled posting loop. Transport, timer
// and store are owned by the caller.
class PosterBot {
public:
    using NowFn = std::function<std::chrono::system_clock::time_point()>;

    PosterBot(const Config& config, ConfigStore& store, Timer& timer, BotTransport& transport, NowFn now = nullptr);
    ~PosterBot();

    bool start();
    void shutdown();

    void handle_update(const TelegramUpdate& update);

    // Waits for queued posts and downloads to finish.
    void wait_idle();

    IntervalScheduler& scheduler() { return scheduler_; }

private:
    void handle_command(const ParsedCommand& cmd, const TelegramUpdate& update);

    void cmd_help(int64_t chat_id);
    void cmd_status(int64_t chat_id);
    void cmd_set_channel(const ParsedCommand& cmd, int64_t chat_id);
    void cmd_set_interval(const ParsedCommand& cmd, int64_t chat_id);
    void cmd_post(int64_t chat_id);
    void cmd_set_picture(const TelegramUpdate& update, int64_t chat_id);

    void on_post_due();
    void run_scheduled_post();
    void reply(int64_t chat_id, const std::string& text);
    std::string status_report();

    Config config_;
    ConfigStore& store_;
    BotTransport& transport_;
    NowFn now_;
    AdminAuth auth_;
    IntervalScheduler scheduler_;
    PostCoordinator coordinator_;
    PostWorker worker_;
};
