#pragma once

#include "core/bot_errors.hpp"
#include "core/messaging_gateway.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Bot API call that failed at the HTTP or API level
 */
class TelegramApiError : public BotError
{
public:
    explicit TelegramApiError(const std::string &message) : BotError(message) {}
};

/**
 * @brief MessagingGateway over the Telegram Bot HTTP API
 *
 * Each outgoing call uses its own HTTP client so calls from different
 * worker threads never share a connection. Long polling uses a dedicated
 * client that stop() can interrupt. The token never appears in logs.
 */
class TelegramGateway : public MessagingGateway
{
public:
    TelegramGateway(std::string api_base_url, std::string token, int poll_timeout_seconds);

    /**
     * @brief Long-poll for updates with update_id >= offset
     * @return Raw getUpdates response
     * @throws TelegramApiError on transport failure
     */
    nlohmann::json getUpdates(std::uint64_t offset);

    // Interrupt a getUpdates call in progress
    void stop();

    // Check the token with getMe, returns the bot's username
    std::string getMe();

    void sendText(ChatId chat, const std::string &text) override;
    void sendChoicePrompt(ChatId chat, const std::string &text, const std::vector<ChoiceButton> &buttons) override;
    void sendDocument(ChatId chat, const std::string &path, const std::string &filename) override;
    void editMessageText(ChatId chat, std::int64_t message_id, const std::string &text) override;
    void answerCallback(const std::string &callback_id) override;
    void downloadFile(const std::string &file_id, const std::string &dest_path) override;

    // Request body of sendMessage with an inline keyboard, one button per row
    static nlohmann::json buildChoicePrompt(ChatId chat, const std::string &text,
                                            const std::vector<ChoiceButton> &buttons);

private:
    std::unique_ptr<httplib::Client> makeClient(int read_timeout_seconds) const;
    nlohmann::json call(const std::string &method, const nlohmann::json &params) const;
    static nlohmann::json checkResponse(const std::string &method, const httplib::Result &res);
    std::string methodPath(const std::string &method) const;

    std::string api_base_url_;
    std::string token_;
    int poll_timeout_seconds_;

    std::mutex poll_mutex_;
    std::unique_ptr<httplib::Client> poll_client_;
};
