#pragma once
#include "bot_transport.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct PhotoSize {
    std::string file_id;
    int width = 0;
    int height = 0;
    int64_t file_size = 0;
};

struct TelegramUpdate {
    int64_t update_id = 0;
    struct Message {
        int64_t message_id = 0;
        struct User {
            int64_t id = 0;
            std::string first_name;
            std::string username;
        } from;
        int64_t chat_id = 0;
        std::string text;
        std::vector<PhotoSize> photo;
        std::vector<PhotoSize> reply_photo;
    } message;

    static TelegramUpdate from_json(const nlohmann::json& j);
};

class TelegramClient : public BotTransport {
public:
    explicit TelegramClient(const std::string& bot_token);

    SendResult send_message(int64_t chat_id, const std::string& text) override;
    SendResult send_photo(const std::string& channel, const std::string& picture_path) override;
    SendResult download_file(const std::string& file_id, const std::string& destination) override;

    bool delete_webhook();
    std::vector<TelegramUpdate> get_updates(int64_t offset = 0, int timeout = 30);

private:
    std::string api_base_url_;
    std::string file_base_url_;

    nlohmann::json make_request(const std::string& method, const nlohmann::json& params = {}, int timeout_seconds = 30);
    static nlohmann::json parse_response(int status_code, const std::string& body);
    static std::string describe_error(const nlohmann::json& response);
};
