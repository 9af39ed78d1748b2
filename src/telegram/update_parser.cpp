#include "telegram/update_parser.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

namespace
{
    bool startsWith(const std::string &value, const std::string &prefix)
    {
        return value.compare(0, prefix.size(), prefix) == 0;
    }

    // Attachments we recognise but do not handle
    const char *const OTHER_ATTACHMENTS[] = {"photo", "audio", "voice", "sticker", "video_note"};
}

void UpdateParser::fillFile(const nlohmann::json &file, UploadEvent &upload)
{
    upload.file_id = file.value("file_id", "");
    upload.suggested_name = file.value("file_name", "");
    upload.declared_size = file.value("file_size", static_cast<std::int64_t>(0));
}

bool UpdateParser::parseMessage(const nlohmann::json &message, ParsedUpdate &out)
{
    if (!message.contains("from") || !message.contains("chat"))
    {
        return false;
    }
    const UserId user = message["from"].value("id", static_cast<UserId>(0));
    const ChatId chat = message["chat"].value("id", static_cast<ChatId>(0));

    UploadEvent upload;
    upload.sequence = out.update_id;
    upload.user_id = user;
    upload.chat_id = chat;

    // Animations also carry a "document" field, so check them first
    if (message.contains("video"))
    {
        upload.kind = MediaKind::Video;
        upload.attachment_type = "video";
        fillFile(message["video"], upload);
    }
    else if (message.contains("animation"))
    {
        upload.kind = MediaKind::Animation;
        upload.attachment_type = "animation";
        fillFile(message["animation"], upload);
    }
    else if (message.contains("document"))
    {
        const auto &document = message["document"];
        const std::string mime = document.value("mime_type", "");
        upload.attachment_type = "document";
        fillFile(document, upload);
        if (startsWith(mime, "video/"))
        {
            upload.kind = MediaKind::Video;
        }
        else if (mime == "image/gif")
        {
            upload.kind = MediaKind::Animation;
        }
    }
    else
    {
        for (const char *name : OTHER_ATTACHMENTS)
        {
            if (message.contains(name))
            {
                upload.attachment_type = name;
                break;
            }
        }
    }

    if (!upload.attachment_type.empty())
    {
        out.type = ParsedUpdate::Type::Upload;
        out.upload = upload;
        return true;
    }

    const std::string text = message.value("text", "");
    if (text.size() > 1 && text[0] == '/')
    {
        std::string command = text.substr(1, text.find_first_of(" \n") - 1);
        auto at = command.find('@');
        if (at != std::string::npos)
        {
            command.erase(at);
        }
        out.type = ParsedUpdate::Type::Command;
        out.command.sequence = out.update_id;
        out.command.user_id = user;
        out.command.chat_id = chat;
        out.command.command = command;
        return true;
    }
    return false;
}

bool UpdateParser::parseCallback(const nlohmann::json &callback, ParsedUpdate &out)
{
    if (!callback.contains("from"))
    {
        return false;
    }
    DecisionEvent decision;
    decision.sequence = out.update_id;
    decision.user_id = callback["from"].value("id", static_cast<UserId>(0));
    decision.callback_id = callback.value("id", "");
    decision.token = callback.value("data", "");

    if (callback.contains("message"))
    {
        const auto &message = callback["message"];
        decision.message_id = message.value("message_id", static_cast<std::int64_t>(0));
        if (message.contains("chat"))
        {
            decision.chat_id = message["chat"].value("id", static_cast<ChatId>(0));
        }
    }
    if (decision.chat_id == 0)
    {
        // Private chats share the user's id
        decision.chat_id = decision.user_id;
    }

    out.type = ParsedUpdate::Type::Decision;
    out.decision = decision;
    return true;
}

ParsedUpdate UpdateParser::parse(const nlohmann::json &update)
{
    ParsedUpdate out;
    out.update_id = update.value("update_id", static_cast<std::uint64_t>(0));

    try
    {
        if (update.contains("message"))
        {
            parseMessage(update["message"], out);
        }
        else if (update.contains("callback_query"))
        {
            parseCallback(update["callback_query"], out);
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::warn("Ignoring malformed update " + std::to_string(out.update_id) + ": " + e.what());
        out.type = ParsedUpdate::Type::Ignored;
    }
    return out;
}

std::vector<ParsedUpdate> UpdateParser::parseResponse(const nlohmann::json &response)
{
    if (!response.value("ok", false))
    {
        throw std::runtime_error("getUpdates failed: " + response.value("description", std::string("unknown error")));
    }

    std::vector<ParsedUpdate> updates;
    if (!response.contains("result") || !response["result"].is_array())
    {
        return updates;
    }
    for (const auto &update : response["result"])
    {
        updates.push_back(parse(update));
    }
    return updates;
}
