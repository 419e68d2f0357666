#pragma once
#include "post_config.hpp"
#include "retry_backoff.hpp"
#include <chrono>
#include <string>
#include <cstdint>

// Process settings from the environment. The bot token and admin id may also
// come from the persisted record; environment values take precedence.
struct Config {
    std::string config_file;
    std::string pictures_dir;
    std::string tg_bot_token;
    int64_t admin_id;
    std::chrono::seconds default_interval;
    int min_interval_seconds;
    int retry_max_attempts;
    int retry_base_seconds;
    int retry_max_seconds;
    int poll_timeout_seconds;
    std::string service_name;
    std::string log_level;

    static Config from_env();

    // Record used when no config file exists yet.
    PostConfig default_record() const;

    // Fills credentials not given in the environment from the loaded record.
    void apply_record(const PostConfig& record);

    RetryPolicy retry_policy() const;

    void validate() const;
};
