#include "config.hpp"
#include "duration.hpp"
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <fstream>
#include <optional>

namespace {

std::optional<std::string> read_secret(const std::string& file_env, const std::string& value_env) {
    const char* file_path = std::getenv(file_env.c_str());
    if (file_path) {
        std::ifstream file(file_path);
        if (file.is_open()) {
            std::string content;
            std::getline(file, content);
            return content;
        }
        spdlog::warn("{} points to unreadable file {}", file_env, file_path);
    }

    // Fallback to direct environment variable
    const char* value = std::getenv(value_env.c_str());
    if (value) {
        return std::string(value);
    }

    return std::nullopt;
}

std::string get_env(const char* name, const std::string& default_val) {
    const char* value = std::getenv(name);
    return value ? value : default_val;
}

int get_env_int(const char* name, int default_val) {
    const char* value = std::getenv(name);
    if (!value) {
        return default_val;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " must be an integer, got '" + value + "'");
    }
}

}

Config Config::from_env() {
    Config config;

    config.config_file = get_env("CONFIG_FILE", "config.json");
    config.pictures_dir = get_env("PICTURES_DIR", "pictures");

    config.tg_bot_token = read_secret("TG_BOT_TOKEN_FILE", "TG_BOT_TOKEN").value_or("");

    auto admin_id_str = read_secret("ADMIN_ID_FILE", "ADMIN_ID");
    config.admin_id = 0;
    if (admin_id_str) {
        try {
            config.admin_id = std::stoll(*admin_id_str);
        } catch (const std::exception&) {
            throw std::runtime_error("ADMIN_ID must be a Telegram user id, got '" + *admin_id_str + "'");
        }
    }

    std::string interval_str = get_env("DEFAULT_INTERVAL", "24h");
    auto interval = parse_interval(interval_str);
    if (!interval || interval->count() <= 0) {
        throw std::runtime_error("Invalid DEFAULT_INTERVAL: " + interval_str);
    }
    config.default_interval = *interval;

    config.min_interval_seconds = get_env_int("MIN_INTERVAL_SECONDS", 10);
    config.retry_max_attempts = get_env_int("RETRY_MAX_ATTEMPTS", 3);
    config.retry_base_seconds = get_env_int("RETRY_BASE_SECONDS", 30);
    config.retry_max_seconds = get_env_int("RETRY_MAX_SECONDS", 600);
    config.poll_timeout_seconds = get_env_int("POLL_TIMEOUT_SECONDS", 30);
    config.service_name = get_env("SERVICE_NAME", "picture_poster");
    config.log_level = get_env("LOG_LEVEL", "info");

    return config;
}

PostConfig Config::default_record() const {
    PostConfig record;
    record.bot_token = tg_bot_token;
    record.admin_id = admin_id;
    record.post_interval = default_interval;
    return record;
}

void Config::apply_record(const PostConfig& record) {
    if (tg_bot_token.empty()) {
        tg_bot_token = record.bot_token;
    }
    if (admin_id == 0) {
        admin_id = record.admin_id;
    }
}

RetryPolicy Config::retry_policy() const {
    RetryPolicy policy;
    policy.max_attempts = retry_max_attempts;
    policy.base_delay = std::chrono::seconds(retry_base_seconds);
    policy.max_delay = std::chrono::seconds(retry_max_seconds);
    return policy;
}

void Config::validate() const {
    if (tg_bot_token.empty()) {
        throw std::runtime_error("Telegram bot token is required");
    }

    if (admin_id == 0) {
        throw std::runtime_error("Admin Telegram ID is required");
    }

    if (min_interval_seconds < 1) {
        throw std::runtime_error("MIN_INTERVAL_SECONDS must be at least 1");
    }

    if (retry_max_attempts < 1) {
        throw std::runtime_error("RETRY_MAX_ATTEMPTS must be at least 1");
    }

    if (retry_base_seconds < static_cast<int>(RetryBackoff::kMinDelay.count()) || retry_max_seconds < retry_base_seconds) {
        throw std::runtime_error("Retry delays must satisfy 5 <= RETRY_BASE_SECONDS <= RETRY_MAX_SECONDS");
    }

    if (poll_timeout_seconds < 1) {
        throw std::runtime_error("POLL_TIMEOUT_SECONDS must be positive");
    }
}
