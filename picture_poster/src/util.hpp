#pragma once
#include <string>
#include <chrono>
#include <cstdint>

namespace util {
    void setup_logging(const std::string& level, const std::string& logger_name = "picture_poster");
    std::string format_local_time(std::chrono::system_clock::time_point tp);
    int64_t to_unix_seconds(std::chrono::system_clock::time_point tp);
    std::chrono::system_clock::time_point from_unix_seconds(int64_t seconds);
    double random_jitter(double base_value, double jitter_factor = 0.1);
    bool starts_with(const std::string& str, const std::string& prefix);
}
