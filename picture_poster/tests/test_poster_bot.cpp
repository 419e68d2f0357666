#include "poster_bot.hpp"
#include "test_helpers.hpp"
#include "util.hpp"
#include <gtest/gtest.h>
#include <memory>

using namespace std::chrono_literals;
using test_support::FakeClock;
using test_support::FakeTransport;
using test_support::ManualTimer;
using test_support::TempDir;

namespace {

constexpr int64_t kAdmin = 42;
constexpr int64_t kStranger = 7;

TelegramUpdate command_from(int64_t user_id, const std::string& text) {
    TelegramUpdate update;
    update.update_id = 1;
    update.message.message_id = 10;
    update.message.from.id = user_id;
    update.message.chat_id = user_id;
    update.message.text = text;
    return update;
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

}

class PosterBotTest : public ::testing::Test {
protected:
    PosterBotTest() {
        config_.config_file = (dir_.path() / "config.json").string();
        config_.pictures_dir = (dir_.path() / "pictures").string();
        config_.tg_bot_token = "123:abc";
        config_.admin_id = kAdmin;
        config_.default_interval = 24h;
        config_.min_interval_seconds = 10;
        config_.retry_max_attempts = 3;
        config_.retry_base_seconds = 30;
        config_.retry_max_seconds = 600;
        config_.poll_timeout_seconds = 1;
        config_.service_name = "picture_poster";
        config_.log_level = "info";
    }

    void start_bot(PostConfig record) {
        record.bot_token = config_.tg_bot_token;
        record.admin_id = config_.admin_id;
        store_ = std::make_unique<ConfigStore>(config_.config_file, record);
        store_->load();
        bot_ = std::make_unique<PosterBot>(config_, *store_, timer_, transport_, clock_.fn());
        ASSERT_TRUE(bot_->start());
    }

    PostConfig ready_record() {
        PostConfig record;
        record.channel_name = "@pictures";
        record.picture_path = dir_.write_file("pictures/current.jpg", "jpeg").string();
        record.post_interval = 24h;
        return record;
    }

    void send(const std::string& text, int64_t user = kAdmin) {
        bot_->handle_update(command_from(user, text));
    }

    TempDir dir_;
    FakeClock clock_;
    ManualTimer timer_;
    FakeTransport transport_;
    Config config_{};
    std::unique_ptr<ConfigStore> store_;
    std::unique_ptr<PosterBot> bot_;
};

TEST_F(PosterBotTest, RejectsCommandsFromOtherUsers) {
    start_bot(ready_record());

    send("/post", kStranger);

    EXPECT_EQ(transport_.last_message(), "You are not authorized to use this bot.");
    EXPECT_EQ(transport_.photo_attempts(), 0);
}

TEST_F(PosterBotTest, HelpListsCommands) {
    start_bot(PostConfig{});

    send("/help");

    EXPECT_TRUE(contains(transport_.last_message(), "/setinterval"));
    EXPECT_TRUE(contains(transport_.last_message(), "/setpicture"));
}

TEST_F(PosterBotTest, PlainTextFromAdminGetsFormatHint) {
    start_bot(PostConfig{});

    send("hello");

    EXPECT_TRUE(contains(transport_.last_message(), "Invalid command format"));
}

TEST_F(PosterBotTest, SetChannelRequiresAtPrefix) {
    start_bot(PostConfig{});

    send("/setchannel pictures");
    EXPECT_TRUE(contains(transport_.last_message(), "starting with @"));
    EXPECT_TRUE(store_->current().channel_name.empty());

    send("/setchannel @pictures");
    EXPECT_EQ(transport_.last_message(), "Channel set to @pictures");

    ConfigStore reloaded(config_.config_file, PostConfig{});
    EXPECT_EQ(reloaded.load().channel_name, "@pictures");
}

TEST_F(PosterBotTest, SetIntervalValidatesInput) {
    start_bot(ready_record());

    send("/setinterval");
    EXPECT_TRUE(contains(transport_.last_message(), "Please provide a time interval"));

    send("/setinterval often");
    EXPECT_EQ(transport_.last_message(), "Invalid time interval format: often");

    send("/setinterval 5s");
    EXPECT_EQ(transport_.last_message(), "Interval must be at least 10 seconds.");

    EXPECT_EQ(store_->current().post_interval, 24h);
}

TEST_F(PosterBotTest, SetIntervalReschedulesFromLastPost) {
    auto record = ready_record();
    record.last_post_time = clock_.now() - 2h;
    start_bot(record);

    send("/setinterval 6h");

    EXPECT_EQ(transport_.last_message(), "Posting interval set to 6h (6h)");
    EXPECT_EQ(store_->current().post_interval, 6h);
    EXPECT_EQ(bot_->scheduler().next_due(), clock_.now() + 4h);
    EXPECT_EQ(timer_.due(), clock_.now() + 4h);
}

TEST_F(PosterBotTest, PostCommandSendsPictureAndMovesSchedule) {
    start_bot(ready_record());
    clock_.advance(1h);

    send("/post");
    bot_->wait_idle();

    ASSERT_EQ(transport_.photos().size(), 1u);
    EXPECT_EQ(transport_.photos()[0].channel, "@pictures");
    EXPECT_EQ(transport_.last_message(), "Picture posted successfully!");
    EXPECT_EQ(store_->current().last_post_time, clock_.now());
    EXPECT_EQ(bot_->scheduler().next_due(), clock_.now() + 24h);
}

TEST_F(PosterBotTest, PostCommandReportsSendError) {
    start_bot(ready_record());
    transport_.fail_next_sends(1);

    send("/post");
    bot_->wait_idle();

    EXPECT_EQ(transport_.last_message(), "Error posting picture: Bad Request: chat not found");
    EXPECT_FALSE(store_->current().last_post_time.has_value());
}

TEST_F(PosterBotTest, StatusShowsSettingsAndCountdown) {
    start_bot(ready_record());

    send("/status");

    auto text = transport_.last_message();
    EXPECT_TRUE(contains(text, "Channel: @pictures"));
    EXPECT_TRUE(contains(text, "Posting interval: 1d (86400 seconds)"));
    EXPECT_TRUE(contains(text, "No posts have been made yet."));
    EXPECT_TRUE(contains(text, "Time until next post: 1d 0h 0m 0s"));
}

TEST_F(PosterBotTest, SetPictureDownloadsLargestRepliedPhoto) {
    start_bot(PostConfig{});

    auto update = command_from(kAdmin, "/setpicture");
    update.message.reply_photo = {{"small", 90, 90, 1000}, {"large", 1280, 1280, 90000}};
    bot_->handle_update(update);
    bot_->wait_idle();

    ASSERT_EQ(transport_.downloads().size(), 1u);
    EXPECT_EQ(transport_.downloads()[0], "large");

    auto expected = (std::filesystem::path(config_.pictures_dir) /
                     ("picture_" + std::to_string(util::to_unix_seconds(clock_.now())) + ".jpg")).string();
    EXPECT_EQ(store_->current().picture_path, expected);
    EXPECT_TRUE(std::filesystem::exists(expected));
    EXPECT_EQ(transport_.last_message(), "Picture set to " + expected);
}

TEST_F(PosterBotTest, SetPictureWithoutPhotoExplainsUsage) {
    start_bot(PostConfig{});

    send("/setpicture");

    EXPECT_TRUE(contains(transport_.last_message(), "reply to a photo"));
    EXPECT_TRUE(transport_.downloads().empty());
}

TEST_F(PosterBotTest, ScheduledFailureIsReportedToAdmin) {
    auto record = ready_record();
    record.last_post_time = clock_.now() - 25h;
    start_bot(record);
    transport_.fail_next_sends(1);

    ASSERT_TRUE(timer_.fire());
    bot_->wait_idle();

    auto messages = transport_.messages();
    ASSERT_FALSE(messages.empty());
    EXPECT_EQ(messages.back().chat_id, kAdmin);
    EXPECT_TRUE(contains(messages.back().text, "Scheduled post failed: Bad Request: chat not found"));
    EXPECT_TRUE(contains(messages.back().text, "Retry 1/3"));
    EXPECT_EQ(bot_->scheduler().retry_attempts(), 1);
}

TEST_F(PosterBotTest, ScheduledPostUpdatesLastPostTime) {
    auto record = ready_record();
    record.last_post_time = clock_.now() - 25h;
    start_bot(record);

    ASSERT_TRUE(timer_.fire());
    bot_->wait_idle();

    EXPECT_EQ(transport_.photos().size(), 1u);
    EXPECT_EQ(store_->current().last_post_time, clock_.now());
    EXPECT_EQ(bot_->scheduler().next_due(), clock_.now() + 24h);
}

TEST_F(PosterBotTest, ThrowingScheduledSendKeepsSchedulerAlive) {
    auto record = ready_record();
    record.last_post_time = clock_.now() - 25h;
    start_bot(record);
    transport_.on_send([] { throw std::runtime_error("connection reset"); });

    ASSERT_TRUE(timer_.fire());
    bot_->wait_idle();

    EXPECT_EQ(bot_->scheduler().state(), SchedulerState::Armed);
    EXPECT_TRUE(timer_.armed());
    auto messages = transport_.messages();
    ASSERT_FALSE(messages.empty());
    EXPECT_EQ(messages.back().chat_id, kAdmin);
    EXPECT_TRUE(contains(messages.back().text, "connection reset"));
    EXPECT_TRUE(contains(messages.back().text, "Retry 1/3"));
}
