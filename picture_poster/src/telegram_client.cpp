#include "telegram_client.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <filesystem>
#include <fstream>

namespace {

std::vector<PhotoSize> parse_photos(const nlohmann::json& photos) {
    std::vector<PhotoSize> sizes;
    for (const auto& p : photos) {
        PhotoSize size;
        size.file_id = p.value("file_id", "");
        size.width = p.value("width", 0);
        size.height = p.value("height", 0);
        size.file_size = p.value("file_size", int64_t{0});
        sizes.push_back(size);
    }
    return sizes;
}

}

TelegramUpdate TelegramUpdate::from_json(const nlohmann::json& j) {
    TelegramUpdate update;
    update.update_id = j["update_id"];

    if (j.contains("message")) {
        const auto& msg = j["message"];
        update.message.message_id = msg["message_id"];
        update.message.chat_id = msg["chat"]["id"];

        if (msg.contains("from")) {
            update.message.from.id = msg["from"]["id"];
            update.message.from.first_name = msg["from"].value("first_name", "");
            update.message.from.username = msg["from"].value("username", "");
        }

        update.message.text = msg.value("text", msg.value("caption", ""));

        if (msg.contains("photo")) {
            update.message.photo = parse_photos(msg["photo"]);
        }

        if (msg.contains("reply_to_message") && msg["reply_to_message"].contains("photo")) {
            update.message.reply_photo = parse_photos(msg["reply_to_message"]["photo"]);
        }
    }

    return update;
}

TelegramClient::TelegramClient(const std::string& bot_token)
    : api_base_url_("https://api.telegram.org/bot" + bot_token),
      file_base_url_("https://api.telegram.org/file/bot" + bot_token) {}

SendResult TelegramClient::send_message(int64_t chat_id, const std::string& text) {
    nlohmann::json params = {
        {"chat_id", chat_id},
        {"text", text}
    };

    auto response = make_request("sendMessage", params);
    if (!response.value("ok", false)) {
        spdlog::error("Failed to send message: {}", response.dump());
        return SendResult::failure(describe_error(response));
    }

    return SendResult::success();
}

SendResult TelegramClient::send_photo(const std::string& channel, const std::string& picture_path) {
    std::string url = api_base_url_ + "/sendPhoto";

    nlohmann::json response;
    try {
        cpr::Response r = cpr::Post(
            cpr::Url{url},
            cpr::Multipart{
                {"chat_id", channel},
                {"photo", cpr::File{picture_path}}
            },
            cpr::Timeout{120000}
        );
        response = parse_response(r.status_code, r.status_code == 0 ? r.error.message : r.text);
    } catch (const std::exception& e) {
        spdlog::error("sendPhoto request failed: {}", e.what());
        return SendResult::failure(std::string("Request failed: ") + e.what());
    }

    if (!response.value("ok", false)) {
        spdlog::error("Failed to send photo to {}: {}", channel, response.dump());
        return SendResult::failure(describe_error(response));
    }

    return SendResult::success();
}

SendResult TelegramClient::download_file(const std::string& file_id, const std::string& destination) {
    auto response = make_request("getFile", {{"file_id", file_id}});
    if (!response.value("ok", false) || !response.contains("result")) {
        spdlog::error("getFile failed for {}: {}", file_id, response.dump());
        return SendResult::failure(describe_error(response));
    }

    std::string file_path = response["result"].value("file_path", "");
    if (file_path.empty()) {
        return SendResult::failure("Telegram returned no file path");
    }

    cpr::Response r;
    try {
        r = cpr::Get(cpr::Url{file_base_url_ + "/" + file_path}, cpr::Timeout{120000});
    } catch (const std::exception& e) {
        spdlog::error("File download failed: {}", e.what());
        return SendResult::failure(std::string("Download failed: ") + e.what());
    }

    if (r.status_code != 200) {
        spdlog::error("File download HTTP error {}: {}", r.status_code, r.error.message);
        return SendResult::failure("Download failed with HTTP " + std::to_string(r.status_code));
    }

    std::error_code ec;
    auto parent = std::filesystem::path(destination).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return SendResult::failure("Cannot open " + destination + " for writing");
    }
    out.write(r.text.data(), static_cast<std::streamsize>(r.text.size()));
    out.close();
    if (!out) {
        return SendResult::failure("Failed to write " + destination);
    }

    spdlog::info("Downloaded {} to {}", file_path, destination);
    return SendResult::success();
}

bool TelegramClient::delete_webhook() {
    auto response = make_request("deleteWebhook");
    bool success = response.value("ok", false);

    if (success) {
        spdlog::info("Webhook deleted");
    } else {
        spdlog::error("Failed to delete webhook: {}", response.dump());
    }

    return success;
}

std::vector<TelegramUpdate> TelegramClient::get_updates(int64_t offset, int timeout) {
    nlohmann::json params = {
        {"offset", offset},
        {"timeout", timeout},
        {"allowed_updates", nlohmann::json::array({"message"})}
    };

    auto response = make_request("getUpdates", params, timeout + 10);
    if (!response.value("ok", false)) {
        throw std::runtime_error("getUpdates: " + describe_error(response));
    }

    std::vector<TelegramUpdate> updates;
    if (response.contains("result")) {
        for (const auto& update_json : response["result"]) {
            try {
                updates.push_back(TelegramUpdate::from_json(update_json));
            } catch (const std::exception& e) {
                spdlog::warn("Failed to parse update: {}", e.what());
            }
        }
    }

    return updates;
}

nlohmann::json TelegramClient::make_request(const std::string& method, const nlohmann::json& params, int timeout_seconds) {
    std::string url = api_base_url_ + "/" + method;

    try {
        cpr::Response response;
        if (params.empty()) {
            response = cpr::Post(cpr::Url{url}, cpr::Timeout{timeout_seconds * 1000});
        } else {
            response = cpr::Post(
                cpr::Url{url},
                cpr::Header{{"Content-Type", "application/json"}},
                cpr::Body{params.dump()},
                cpr::Timeout{timeout_seconds * 1000}
            );
        }

        return parse_response(response.status_code, response.status_code == 0 ? response.error.message : response.text);
    } catch (const std::exception& e) {
        spdlog::error("Request failed: {}", e.what());
        return nlohmann::json{{"ok", false}, {"error", "Request failed"}};
    }
}

nlohmann::json TelegramClient::parse_response(int status_code, const std::string& body) {
    if (status_code == 200) {
        return nlohmann::json::parse(body);
    }

    spdlog::error("HTTP error {}: {}", status_code, body);

    // Telegram error bodies carry a description worth reporting to the admin.
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        parsed["ok"] = false;
        return parsed;
    }
    return nlohmann::json{{"ok", false}, {"error", "HTTP error " + std::to_string(status_code)}};
}

std::string TelegramClient::describe_error(const nlohmann::json& response) {
    if (response.contains("description") && response["description"].is_string()) {
        return response["description"].get<std::string>();
    }
    if (response.contains("error") && response["error"].is_string()) {
        return response["error"].get<std::string>();
    }
    return "Unknown Telegram API error";
}
