#pragma once
#include <cstdint>
#include <string>

struct SendResult {
    bool ok = false;
    std::string error;

    static SendResult success() { return SendResult{true, ""}; }
    static SendResult failure(std::string error) { return SendResult{false, std::move(error)}; }
};

// Messaging platform operations the bot needs. TelegramClient is the
// production implementation.
class BotTransport {
public:
    virtual ~BotTransport() = default;

    virtual SendResult send_message(int64_t chat_id, const std::string& text) = 0;
    virtual SendResult send_photo(const std::string& channel, const std::string& picture_path) = 0;
    virtual SendResult download_file(const std::string& file_id, const std::string& destination) = 0;
};
