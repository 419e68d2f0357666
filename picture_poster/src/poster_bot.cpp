#include "poster_bot.hpp"
#include "duration.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <filesystem>

namespace {

const char* kWelcomeText =
    "Welcome to the Same Picture Posting Bot!\n\n"
    "Commands:\n"
    "/status - Show current bot settings\n"
    "/setchannel @channel_name - Set the target channel\n"
    "/setinterval 1d12h30m - Set posting interval\n"
    "/post - Post the picture now\n"
    "/setpicture - Reply to a photo to set it as the picture to post";

const char* kIntervalUsage =
    "Please provide a time interval.\n"
    "Examples:\n"
    "/setinterval 1d - Once per day\n"
    "/setinterval 12h - Every 12 hours\n"
    "/setinterval 30m - Every 30 minutes\n"
    "/setinterval 1d6h30m - 1 day, 6 hours and 30 minutes\n";

std::string format_countdown(std::chrono::seconds left) {
    auto total = left.count();
    return fmt::format("{}d {}h {}m {}s", total / 86400, (total % 86400) / 3600, (total % 3600) / 60, total % 60);
}

}

PosterBot::PosterBot(const Config& config, ConfigStore& store, Timer& timer, BotTransport& transport, NowFn now)
    : config_(config),
      store_(store),
      transport_(transport),
      now_(now ? std::move(now) : NowFn([] { return std::chrono::system_clock::now(); })),
      auth_(config.admin_id),
      scheduler_(timer, config.retry_policy(), now_),
      coordinator_(store, scheduler_, transport, now_) {}

PosterBot::~PosterBot() {
    shutdown();
}

bool PosterBot::start() {
    worker_.start();

    if (!scheduler_.initialize(store_.current(), [this] { on_post_due(); })) {
        spdlog::error("Failed to initialize post scheduler");
        worker_.stop();
        return false;
    }

    spdlog::info("Picture poster started for admin {}", auth_.admin_id());
    return true;
}

void PosterBot::shutdown() {
    scheduler_.cancel();
    worker_.stop();
}

void PosterBot::wait_idle() {
    worker_.wait_idle();
}

void PosterBot::handle_update(const TelegramUpdate& update) {
    if (update.message.text.empty()) {
        return;
    }

    int64_t user_id = update.message.from.id;
    int64_t chat_id = update.message.chat_id;

    auto parsed = CommandParser::parse(update.message.text);
    if (!parsed) {
        if (auth_.is_authorized(user_id)) {
            reply(chat_id, "Invalid command format. Use /help for available commands.");
        }
        return;
    }

    if (!auth_.is_authorized(user_id)) {
        reply(chat_id, "You are not authorized to use this bot.");
        return;
    }

    spdlog::info("Admin used command: /{}", parsed->command);
    handle_command(*parsed, update);
}

void PosterBot::handle_command(const ParsedCommand& cmd, const TelegramUpdate& update) {
    int64_t chat_id = update.message.chat_id;

    if (cmd.command == "start" || cmd.command == "help") {
        cmd_help(chat_id);
    } else if (cmd.command == "status") {
        cmd_status(chat_id);
    } else if (cmd.command == "setchannel") {
        cmd_set_channel(cmd, chat_id);
    } else if (cmd.command == "setinterval") {
        cmd_set_interval(cmd, chat_id);
    } else if (cmd.command == "post") {
        cmd_post(chat_id);
    } else if (cmd.command == "setpicture") {
        cmd_set_picture(update, chat_id);
    } else {
        reply(chat_id, fmt::format("Unknown command: /{}. Use /help for available commands.", cmd.command));
    }
}

void PosterBot::cmd_help(int64_t chat_id) {
    reply(chat_id, kWelcomeText);
}

void PosterBot::cmd_status(int64_t chat_id) {
    reply(chat_id, status_report());
}

void PosterBot::cmd_set_channel(const ParsedCommand& cmd, int64_t chat_id) {
    auto channel = cmd.get_arg(0);
    if (!channel || channel->size() < 2 || !util::starts_with(*channel, "@")) {
        reply(chat_id,
              "Please provide a valid channel name starting with @.\n"
              "Example: /setchannel @your_channel_name");
        return;
    }

    std::string channel_name = *channel;
    auto result = store_.update([&channel_name](PostConfig& c) { c.channel_name = channel_name; });
    if (!result.ok()) {
        reply(chat_id, "Failed to set channel: " + result.error->message);
        return;
    }

    reply(chat_id, "Channel set to " + channel_name);
}

void PosterBot::cmd_set_interval(const ParsedCommand& cmd, int64_t chat_id) {
    auto text = cmd.get_arg(0);
    if (!text) {
        reply(chat_id, kIntervalUsage);
        return;
    }

    auto interval = parse_interval(*text);
    if (!interval) {
        reply(chat_id, "Invalid time interval format: " + *text);
        return;
    }

    if (interval->count() < config_.min_interval_seconds) {
        reply(chat_id, fmt::format("Interval must be at least {} seconds.", config_.min_interval_seconds));
        return;
    }

    auto new_interval = *interval;
    auto result = store_.update([new_interval](PostConfig& c) { c.post_interval = new_interval; });
    if (!result.ok()) {
        reply(chat_id, "Failed to set interval: " + result.error->message);
        return;
    }

    if (!scheduler_.reschedule(new_interval)) {
        spdlog::warn("Interval saved but scheduler did not accept it");
    }

    reply(chat_id, fmt::format("Posting interval set to {} ({})", *text, format_interval(new_interval)));
}

void PosterBot::cmd_post(int64_t chat_id) {
    bool queued = worker_.submit([this, chat_id] {
        auto result = coordinator_.post_now(PostTrigger::Manual);
        if (result.status == PostStatus::Success && !result.error) {
            reply(chat_id, "Picture posted successfully!");
        } else if (result.status == PostStatus::Success) {
            reply(chat_id, "Picture posted, but saving the post time failed: " + result.error->message);
        } else {
            reply(chat_id, "Error posting picture: " + result.error->message);
        }
    });

    if (!queued) {
        reply(chat_id, "Bot is shutting down, picture not posted.");
    }
}

void PosterBot::cmd_set_picture(const TelegramUpdate& update, int64_t chat_id) {
    // Either a reply to a photo, or a photo captioned with the command.
    const auto& photos = update.message.reply_photo.empty() ? update.message.photo : update.message.reply_photo;
    if (photos.empty()) {
        reply(chat_id, "Please reply to a photo with /setpicture to set it as the picture to post.");
        return;
    }

    // Telegram lists sizes smallest first.
    std::string file_id = photos.back().file_id;
    auto file_path = (std::filesystem::path(config_.pictures_dir) /
                      fmt::format("picture_{}.jpg", util::to_unix_seconds(now_()))).string();

    bool queued = worker_.submit([this, chat_id, file_id, file_path] {
        auto downloaded = transport_.download_file(file_id, file_path);
        if (!downloaded.ok) {
            reply(chat_id, "Failed to download picture: " + downloaded.error);
            return;
        }

        auto result = store_.update([&file_path](PostConfig& c) { c.picture_path = file_path; });
        if (!result.ok()) {
            reply(chat_id, "Failed to set picture: " + result.error->message);
            return;
        }

        reply(chat_id, "Picture set to " + file_path);
    });

    if (!queued) {
        reply(chat_id, "Bot is shutting down, picture not changed.");
    }
}

void PosterBot::on_post_due() {
    // Called on the timer thread; the send happens on the worker.
    if (!worker_.submit([this] { run_scheduled_post(); })) {
        scheduler_.notify_failed("post worker not running");
    }
}

void PosterBot::run_scheduled_post() {
    auto result = coordinator_.post_now(PostTrigger::Scheduled);

    if (result.status == PostStatus::Skipped) {
        return;
    }

    if (result.status == PostStatus::Success) {
        spdlog::info("Scheduled picture posted to {}", store_.current().channel_name);
        if (result.error) {
            reply(auth_.admin_id(), "Scheduled picture posted, but saving the post time failed: " + result.error->message);
        }
        return;
    }

    std::string message = result.error ? result.error->message : "unknown error";
    if (result.retry == FailureOutcome::Exhausted) {
        auto next = scheduler_.next_due();
        reply(auth_.admin_id(), fmt::format(
            "Scheduled post failed after {} attempts: {}\nNext regular post at {}",
            config_.retry_max_attempts + 1, message,
            next ? util::format_local_time(*next) : std::string("(not scheduled)")));
    } else if (result.retry == FailureOutcome::Retrying) {
        auto next = scheduler_.next_due();
        reply(auth_.admin_id(), fmt::format(
            "Scheduled post failed: {}\nRetry {}/{} at {}",
            message, scheduler_.retry_attempts(), config_.retry_max_attempts,
            next ? util::format_local_time(*next) : std::string("(not scheduled)")));
    }
}

void PosterBot::reply(int64_t chat_id, const std::string& text) {
    auto sent = transport_.send_message(chat_id, text);
    if (!sent.ok) {
        spdlog::error("Failed to reply to chat {}: {}", chat_id, sent.error);
    }
}

std::string PosterBot::status_report() {
    PostConfig config = store_.current();
    auto interval = config.post_interval;

    std::string text = fmt::format(
        "📊 Current Bot Settings 📊\n\n"
        "🔹 Channel: {}\n"
        "🔹 Picture: {}\n"
        "🔹 Posting interval: {} ({} seconds)\n",
        config.channel_name.empty() ? "(not set)" : config.channel_name,
        config.picture_path.empty() ? "(not set)" : config.picture_path,
        format_interval(interval), interval.count());

    if (config.last_post_time) {
        text += fmt::format("🔹 Last post: {}\n", util::format_local_time(*config.last_post_time));
    } else {
        text += "🔹 No posts have been made yet.\n";
    }

    if (scheduler_.is_firing()) {
        text += "🔹 Next post: posting now\n";
    } else if (auto next = scheduler_.next_due()) {
        text += fmt::format("🔹 Next post: {}\n", util::format_local_time(*next));

        auto now = now_();
        if (*next > now) {
            auto left = std::chrono::duration_cast<std::chrono::seconds>(*next - now);
            text += fmt::format("🔹 Time until next post: {}\n", format_countdown(left));
        }
    }

    int attempts = scheduler_.retry_attempts();
    if (attempts > 0) {
        text += fmt::format("🔹 Retrying failed post (attempt {}/{})\n", attempts, config_.retry_max_attempts);
    }

    return text;
}
