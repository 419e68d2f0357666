#pragma once
#include <chrono>
#include <optional>
#include <string>

// Parses "1d12h30m45s" style intervals (any subset of d/h/m/s, in that order)
// or a bare number of seconds.
std::optional<std::chrono::seconds> parse_interval(const std::string& text);

// Inverse of parse_interval, e.g. 90061 -> "1d1h1m1s", 0 -> "0s".
std::string format_interval(std::chrono::seconds interval);
