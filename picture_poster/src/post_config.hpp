#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

// The persisted configuration record. One instance lives in ConfigStore.
struct PostConfig {
    std::string bot_token;
    int64_t admin_id = 0;
    std::string channel_name;
    std::string picture_path;
    std::chrono::seconds post_interval{std::chrono::hours(24)};
    std::optional<std::chrono::system_clock::time_point> last_post_time;

    nlohmann::json to_json() const;
    static PostConfig from_json(const nlohmann::json& j);

    // Returns a description of the first violated field rule, checked against
    // the previously committed record.
    std::optional<std::string> validate(const PostConfig& previous) const;

    bool operator==(const PostConfig& other) const;
    bool operator!=(const PostConfig& other) const { return !(*this == other); }
};
