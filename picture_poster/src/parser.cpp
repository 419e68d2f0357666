#include "parser.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>

std::optional<std::string> ParsedCommand::get_arg(size_t index) const {
    if (index < args.size()) {
        return args[index];
    }
    return std::nullopt;
}

std::optional<ParsedCommand> CommandParser::parse(const std::string& text) {
    if (!is_command(text)) {
        return std::nullopt;
    }

    auto args = split_args(text);
    if (args.empty()) {
        return std::nullopt;
    }

    ParsedCommand cmd;
    cmd.command = args[0].substr(1); // Remove leading '/'

    // "/status@my_bot" in group chats
    auto at = cmd.command.find('@');
    if (at != std::string::npos) {
        cmd.command = cmd.command.substr(0, at);
    }
    if (cmd.command.empty()) {
        return std::nullopt;
    }

    std::transform(cmd.command.begin(), cmd.command.end(), cmd.command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    cmd.args.assign(args.begin() + 1, args.end());

    return cmd;
}

bool CommandParser::is_command(const std::string& text) {
    return !text.empty() && text[0] == '/';
}

std::vector<std::string> CommandParser::split_args(const std::string& text) {
    std::istringstream iss(text);
    std::vector<std::string> args;
    std::string arg;

    while (iss >> arg) {
        args.push_back(arg);
    }

    return args;
}
