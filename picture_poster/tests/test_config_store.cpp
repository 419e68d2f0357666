#include "config_store.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;
using test_support::TempDir;
using test_support::at_seconds;

namespace {

PostConfig make_defaults() {
    PostConfig defaults;
    defaults.bot_token = "123:abc";
    defaults.admin_id = 42;
    defaults.post_interval = 24h;
    return defaults;
}

}

class ConfigStoreTest : public ::testing::Test {
protected:
    TempDir dir_;
    std::filesystem::path path_ = dir_.path() / "config.json";
};

TEST_F(ConfigStoreTest, FirstRunPersistsDefaults) {
    ConfigStore store(path_, make_defaults());
    PostConfig loaded = store.load();

    EXPECT_EQ(loaded, make_defaults());
    EXPECT_TRUE(loaded.channel_name.empty());
    EXPECT_TRUE(loaded.picture_path.empty());
    EXPECT_FALSE(loaded.last_post_time.has_value());
    ASSERT_TRUE(std::filesystem::exists(path_));

    auto j = nlohmann::json::parse(test_support::read_file(path_));
    EXPECT_TRUE(j["last_post_time"].is_null());
    EXPECT_EQ(j["post_interval"], "1d");
}

TEST_F(ConfigStoreTest, UpdateSurvivesRestart) {
    PostConfig expected;
    {
        ConfigStore store(path_, make_defaults());
        store.load();
        auto result = store.update([](PostConfig& c) {
            c.channel_name = "@pictures";
            c.picture_path = "pictures/picture_1.jpg";
            c.post_interval = 90min;
            c.last_post_time = at_seconds(1700000000);
        });
        ASSERT_TRUE(result.ok());
        expected = result.config;
    }

    ConfigStore restarted(path_, PostConfig{});
    EXPECT_EQ(restarted.load(), expected);
    EXPECT_EQ(restarted.current().post_interval, 90min);
    EXPECT_EQ(restarted.current().last_post_time, at_seconds(1700000000));
}

TEST_F(ConfigStoreTest, RejectsNonPositiveInterval) {
    ConfigStore store(path_, make_defaults());
    PostConfig before = store.load();
    std::string on_disk = test_support::read_file(path_);

    auto result = store.update([](PostConfig& c) { c.post_interval = 0s; });

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorKind::Validation);
    EXPECT_EQ(result.config, before);
    EXPECT_EQ(store.current(), before);
    EXPECT_EQ(test_support::read_file(path_), on_disk);
}

TEST_F(ConfigStoreTest, RejectsClearingChannelOnceSet) {
    ConfigStore store(path_, make_defaults());
    store.load();
    ASSERT_TRUE(store.update([](PostConfig& c) { c.channel_name = "@pictures"; }).ok());

    auto result = store.update([](PostConfig& c) { c.channel_name.clear(); });

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorKind::Validation);
    EXPECT_EQ(store.current().channel_name, "@pictures");
}

TEST_F(ConfigStoreTest, AllowsUnsetFieldsBeforeFirstAssignment) {
    ConfigStore store(path_, make_defaults());
    store.load();

    auto result = store.update([](PostConfig& c) { c.post_interval = 12h; });

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(store.current().post_interval, 12h);
    EXPECT_TRUE(store.current().picture_path.empty());
}

TEST_F(ConfigStoreTest, WriteFailureKeepsPriorRecord) {
    auto nested = dir_.path() / "state";
    std::filesystem::create_directories(nested);
    ConfigStore store(nested / "config.json", make_defaults());
    PostConfig before = store.load();

    std::filesystem::remove_all(nested);
    auto result = store.update([](PostConfig& c) { c.channel_name = "@pictures"; });

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorKind::Persist);
    EXPECT_EQ(result.config, before);
    EXPECT_EQ(store.current(), before);
}

TEST_F(ConfigStoreTest, TornTemporaryFileIsIgnoredOnLoad) {
    PostConfig committed;
    {
        ConfigStore store(path_, make_defaults());
        store.load();
        committed = store.update([](PostConfig& c) { c.channel_name = "@pictures"; }).config;
    }

    // A crash mid-write leaves a partial temporary file next to the record.
    dir_.write_file("config.json.tmp", "{\"bot_token\": \"123:abc\", \"channel_na");

    ConfigStore restarted(path_, PostConfig{});
    EXPECT_EQ(restarted.load(), committed);
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "config.json.tmp"));
}

TEST_F(ConfigStoreTest, CorruptRecordIsStartupError) {
    dir_.write_file("config.json", "{not json");
    ConfigStore store(path_, make_defaults());
    EXPECT_THROW(store.load(), std::runtime_error);
}

TEST_F(ConfigStoreTest, UnreadableRecordIsStartupErrorAndKept) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root ignores file permissions";
    }

    {
        ConfigStore store(path_, make_defaults());
        store.load();
        store.update([](PostConfig& c) {
            c.channel_name = "@pictures";
            c.last_post_time = at_seconds(1700000000);
        });
    }
    std::string saved = test_support::read_file(path_);
    std::filesystem::permissions(path_, std::filesystem::perms::none);

    ConfigStore restarted(path_, PostConfig{});
    EXPECT_THROW(restarted.load(), std::runtime_error);

    std::filesystem::permissions(path_, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
    EXPECT_EQ(test_support::read_file(path_), saved);
}

TEST_F(ConfigStoreTest, NonFileAtRecordPathIsStartupError) {
    std::filesystem::create_directories(path_);

    ConfigStore store(path_, make_defaults());
    EXPECT_THROW(store.load(), std::runtime_error);
    EXPECT_TRUE(std::filesystem::is_directory(path_));
}

TEST_F(ConfigStoreTest, AcceptsIntervalInSeconds) {
    dir_.write_file("config.json", R"({
        "bot_token": "123:abc",
        "admin_id": 42,
        "channel_name": "@pictures",
        "picture_path": "pictures/a.jpg",
        "post_interval": 3600,
        "last_post_time": 1700000000
    })");

    ConfigStore store(path_, PostConfig{});
    PostConfig loaded = store.load();

    EXPECT_EQ(loaded.post_interval, 1h);
    EXPECT_EQ(loaded.admin_id, 42);
    EXPECT_EQ(loaded.last_post_time, at_seconds(1700000000));
}

TEST_F(ConfigStoreTest, LastPostTimeIsStoredAtSecondPrecision) {
    ConfigStore store(path_, make_defaults());
    store.load();

    auto precise = at_seconds(1700000000) + 750ms;
    auto result = store.update([precise](PostConfig& c) { c.last_post_time = precise; });

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(store.current().last_post_time, at_seconds(1700000000));

    ConfigStore restarted(path_, PostConfig{});
    EXPECT_EQ(restarted.load(), store.current());
}

TEST_F(ConfigStoreTest, ConcurrentUpdatesKeepEachOthersFields) {
    ConfigStore store(path_, make_defaults());
    store.load();

    std::thread admin([&store] {
        for (int i = 1; i <= 20; ++i) {
            store.update([i](PostConfig& c) { c.post_interval = std::chrono::seconds(60 * i); });
        }
    });
    std::thread poster([&store] {
        for (int i = 1; i <= 20; ++i) {
            store.update([i](PostConfig& c) { c.last_post_time = at_seconds(1700000000 + i); });
        }
    });
    admin.join();
    poster.join();

    EXPECT_EQ(store.current().post_interval, std::chrono::seconds(60 * 20));
    EXPECT_EQ(store.current().last_post_time, at_seconds(1700000020));

    ConfigStore restarted(path_, PostConfig{});
    EXPECT_EQ(restarted.load(), store.current());
}
