#include "post_config.hpp"
#include "duration.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <stdexcept>

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Persist: return "persist";
        case ErrorKind::Send: return "send";
        case ErrorKind::NotFound: return "not_found";
    }
    return "unknown";
}

nlohmann::json PostConfig::to_json() const {
    nlohmann::json j = {
        {"bot_token", bot_token},
        {"admin_id", admin_id},
        {"channel_name", channel_name},
        {"picture_path", picture_path},
        {"post_interval", format_interval(post_interval)},
        {"last_post_time", nullptr}
    };

    if (last_post_time) {
        j["last_post_time"] = util::to_unix_seconds(*last_post_time);
    }

    return j;
}

PostConfig PostConfig::from_json(const nlohmann::json& j) {
    PostConfig config;
    config.bot_token = j.value("bot_token", "");
    config.admin_id = j.value("admin_id", int64_t{0});
    config.channel_name = j.value("channel_name", "");
    config.picture_path = j.value("picture_path", "");

    if (j.contains("post_interval")) {
        const auto& interval = j["post_interval"];
        if (interval.is_number_integer()) {
            config.post_interval = std::chrono::seconds(interval.get<int64_t>());
        } else if (interval.is_string()) {
            auto parsed = parse_interval(interval.get<std::string>());
            if (!parsed) {
                throw std::runtime_error("Invalid post_interval: " + interval.get<std::string>());
            }
            config.post_interval = *parsed;
        } else {
            throw std::runtime_error("post_interval must be a string or a number of seconds");
        }
    }

    if (j.contains("last_post_time") && !j["last_post_time"].is_null()) {
        config.last_post_time = util::from_unix_seconds(j["last_post_time"].get<int64_t>());
    }

    return config;
}

std::optional<std::string> PostConfig::validate(const PostConfig& previous) const {
    if (post_interval.count() <= 0) {
        return "Posting interval must be positive";
    }

    // Empty is only valid until the field is first set.
    if (channel_name.empty() && !previous.channel_name.empty()) {
        return "Channel name cannot be empty";
    }

    if (picture_path.empty() && !previous.picture_path.empty()) {
        return "Picture path cannot be empty";
    }

    return std::nullopt;
}

bool PostConfig::operator==(const PostConfig& other) const {
    return bot_token == other.bot_token &&
           admin_id == other.admin_id &&
           channel_name == other.channel_name &&
           picture_path == other.picture_path &&
           post_interval == other.post_interval &&
           last_post_time == other.last_post_time;
}
