#include "duration.hpp"
#include <cstdint>
#include <regex>

namespace {

int64_t group_value(const std::smatch& match, size_t index) {
    if (!match[index].matched) {
        return 0;
    }
    return std::stoll(match[index].str());
}

}

std::optional<std::chrono::seconds> parse_interval(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    static const std::regex seconds_regex("^(\\d{1,9})$");
    static const std::regex interval_regex("^(?:(\\d{1,6})d)?(?:(\\d{1,7})h)?(?:(\\d{1,9})m)?(?:(\\d{1,9})s)?$");

    std::smatch match;
    try {
        if (std::regex_match(text, match, seconds_regex)) {
            return std::chrono::seconds(std::stoll(match[1].str()));
        }

        if (!std::regex_match(text, match, interval_regex)) {
            return std::nullopt;
        }

        if (!match[1].matched && !match[2].matched && !match[3].matched && !match[4].matched) {
            return std::nullopt;
        }

        int64_t total = group_value(match, 1) * 86400
                      + group_value(match, 2) * 3600
                      + group_value(match, 3) * 60
                      + group_value(match, 4);
        return std::chrono::seconds(total);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_interval(std::chrono::seconds interval) {
    int64_t seconds = interval.count();
    if (seconds < 0) {
        seconds = 0;
    }

    int64_t days = seconds / 86400;
    seconds %= 86400;
    int64_t hours = seconds / 3600;
    seconds %= 3600;
    int64_t minutes = seconds / 60;
    seconds %= 60;

    std::string result;
    if (days > 0) {
        result += std::to_string(days) + "d";
    }
    if (hours > 0) {
        result += std::to_string(hours) + "h";
    }
    if (minutes > 0) {
        result += std::to_string(minutes) + "m";
    }
    if (seconds > 0 || result.empty()) {
        result += std::to_string(seconds) + "s";
    }

    return result;
}
