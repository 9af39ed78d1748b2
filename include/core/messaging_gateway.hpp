#pragma once

#include "core/media_item.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief A file attached to an incoming chat message
 *
 * kind is empty when the attachment is neither a video nor an animation.
 */
struct UploadEvent
{
    std::uint64_t sequence = 0;
    UserId user_id = 0;
    ChatId chat_id = 0;
    std::string file_id;
    std::optional<MediaKind> kind;
    std::string attachment_type; // "video", "animation", "photo", "document", ...
    std::string suggested_name;
    std::int64_t declared_size = 0; // 0 when the sender did not say
};

/**
 * @brief A press on one of the choice buttons
 */
struct DecisionEvent
{
    std::uint64_t sequence = 0;
    UserId user_id = 0;
    ChatId chat_id = 0;
    std::int64_t message_id = 0; // message carrying the prompt
    std::string callback_id;
    std::string token;
};

/**
 * @brief A slash command such as /start
 */
struct CommandEvent
{
    std::uint64_t sequence = 0;
    UserId user_id = 0;
    ChatId chat_id = 0;
    std::string command; // without the slash or bot suffix
};

struct ChoiceButton
{
    std::string label;
    std::string token;
};

/**
 * @brief Chat transport used by the session controller
 *
 * Every method may throw std::exception on transport failure.
 */
class MessagingGateway
{
public:
    virtual ~MessagingGateway() = default;

    virtual void sendText(ChatId chat, const std::string &text) = 0;

    // Send text with one inline button per row
    virtual void sendChoicePrompt(ChatId chat, const std::string &text, const std::vector<ChoiceButton> &buttons) = 0;

    virtual void sendDocument(ChatId chat, const std::string &path, const std::string &filename) = 0;

    // Replace the text of a message previously sent by the bot
    virtual void editMessageText(ChatId chat, std::int64_t message_id, const std::string &text) = 0;

    // Acknowledge a button press so the client stops its spinner
    virtual void answerCallback(const std::string &callback_id) = 0;

    /**
     * @brief Download an incoming file into dest_path
     * @throws StorageIOError when the file cannot be fetched or written
     */
    virtual void downloadFile(const std::string &file_id, const std::string &dest_path) = 0;
};
