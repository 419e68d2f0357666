#include "config.hpp"
#include "config_store.hpp"
#include "poller.hpp"
#include "poster_bot.hpp"
#include "telegram_client.hpp"
#include "timer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <condition_variable>
#include <memory>
#include <mutex>

// For graceful shutdown
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;
bool shutdown_requested = false;

void signal_handler(int signum) {
    spdlog::warn("Signal {} received, initiating graceful shutdown.", signum);
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex);
        if (shutdown_requested) return;
        shutdown_requested = true;
    }
    shutdown_cv.notify_one();
}

int main() {
    util::setup_logging("info");

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        Config config = Config::from_env();
        util::setup_logging(config.log_level, config.service_name);

        ConfigStore store(config.config_file, config.default_record());
        PostConfig record = store.load();

        config.apply_record(record);
        config.validate();
        spdlog::info("Configuration loaded for service: {}", config.service_name);

        TelegramClient telegram_client(config.tg_bot_token);
        // Polling and webhooks are mutually exclusive on the Bot API.
        if (!telegram_client.delete_webhook()) {
            spdlog::warn("Could not remove webhook, updates may not arrive by polling");
        }

        ThreadTimer timer;
        auto bot = std::make_unique<PosterBot>(config, store, timer, telegram_client);
        if (!bot->start()) {
            spdlog::critical("Failed to start picture poster");
            return 1;
        }

        TelegramPoller poller(telegram_client, config.poll_timeout_seconds);
        poller.start([&bot](const TelegramUpdate& update) {
            bot->handle_update(update);
        });

        // Wait for shutdown signal
        {
            std::unique_lock<std::mutex> lock(shutdown_mutex);
            shutdown_cv.wait(lock, [] { return shutdown_requested; });
        }

        poller.stop();
        bot->shutdown();
        timer.stop();
        bot.reset();

        spdlog::info("Picture poster has shut down. Exiting.");

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred during initialization or runtime: {}", e.what());
        return 1;
    }

    return 0;
}
