#pragma once
#include <string>
#include <vector>
#include <optional>

struct ParsedCommand {
    std::string command;
    std::vector<std::string> args;

    std::optional<std::string> get_arg(size_t index) const;
};

class CommandParser {
public:
    static std::optional<ParsedCommand> parse(const std::string& text);

private:
    static bool is_command(const std::string& text);
    static std::vector<std::string> split_args(const std::string& text);
};
