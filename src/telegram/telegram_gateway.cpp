#include "telegram/telegram_gateway.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <sstream>

namespace
{
    constexpr int CONNECT_TIMEOUT_SECONDS = 10;
    constexpr int REQUEST_TIMEOUT_SECONDS = 30;
    constexpr int UPLOAD_TIMEOUT_SECONDS = 300;
    constexpr int POLL_GRACE_SECONDS = 10;
}

TelegramGateway::TelegramGateway(std::string api_base_url, std::string token, int poll_timeout_seconds)
    : api_base_url_(std::move(api_base_url)),
      token_(std::move(token)),
      poll_timeout_seconds_(poll_timeout_seconds),
      poll_client_(makeClient(poll_timeout_seconds + POLL_GRACE_SECONDS))
{
    Logger::info("TelegramGateway: using API at " + api_base_url_);
}

std::unique_ptr<httplib::Client> TelegramGateway::makeClient(int read_timeout_seconds) const
{
    auto client = std::make_unique<httplib::Client>(api_base_url_);
    client->set_connection_timeout(CONNECT_TIMEOUT_SECONDS, 0);
    client->set_read_timeout(read_timeout_seconds, 0);
    client->set_write_timeout(UPLOAD_TIMEOUT_SECONDS, 0);
    return client;
}

std::string TelegramGateway::methodPath(const std::string &method) const
{
    return "/bot" + token_ + "/" + method;
}

nlohmann::json TelegramGateway::checkResponse(const std::string &method, const httplib::Result &res)
{
    if (!res)
    {
        throw TelegramApiError(method + ": " + httplib::to_string(res.error()));
    }

    nlohmann::json body;
    try
    {
        body = nlohmann::json::parse(res->body);
    }
    catch (const nlohmann::json::parse_error &)
    {
        throw TelegramApiError(method + ": HTTP " + std::to_string(res->status) + " with non-JSON body");
    }

    if (!body.value("ok", false))
    {
        throw TelegramApiError(method + ": " + body.value("description", "HTTP " + std::to_string(res->status)));
    }
    return body;
}

nlohmann::json TelegramGateway::call(const std::string &method, const nlohmann::json &params) const
{
    auto client = makeClient(REQUEST_TIMEOUT_SECONDS);
    auto res = client->Post(methodPath(method), params.dump(), "application/json");
    return checkResponse(method, res)["result"];
}

nlohmann::json TelegramGateway::getUpdates(std::uint64_t offset)
{
    nlohmann::json params = {
        {"offset", offset},
        {"timeout", poll_timeout_seconds_},
        {"allowed_updates", nlohmann::json::array({"message", "callback_query"})},
    };

    std::lock_guard<std::mutex> lock(poll_mutex_);
    auto res = poll_client_->Post(methodPath("getUpdates"), params.dump(), "application/json");
    if (!res)
    {
        throw TelegramApiError("getUpdates: " + httplib::to_string(res.error()));
    }
    try
    {
        return nlohmann::json::parse(res->body);
    }
    catch (const nlohmann::json::parse_error &)
    {
        throw TelegramApiError("getUpdates: HTTP " + std::to_string(res->status) + " with non-JSON body");
    }
}

void TelegramGateway::stop()
{
    // Not under poll_mutex_: getUpdates holds it while blocked
    poll_client_->stop();
}

std::string TelegramGateway::getMe()
{
    auto me = call("getMe", nlohmann::json::object());
    return me.value("username", "");
}

void TelegramGateway::sendText(ChatId chat, const std::string &text)
{
    call("sendMessage", {{"chat_id", chat}, {"text", text}});
}

nlohmann::json TelegramGateway::buildChoicePrompt(ChatId chat, const std::string &text,
                                                  const std::vector<ChoiceButton> &buttons)
{
    nlohmann::json keyboard = nlohmann::json::array();
    for (const auto &button : buttons)
    {
        keyboard.push_back(nlohmann::json::array({{{"text", button.label}, {"callback_data", button.token}}}));
    }
    return {
        {"chat_id", chat},
        {"text", text},
        {"reply_markup", {{"inline_keyboard", keyboard}}},
    };
}

void TelegramGateway::sendChoicePrompt(ChatId chat, const std::string &text, const std::vector<ChoiceButton> &buttons)
{
    call("sendMessage", buildChoicePrompt(chat, text, buttons));
}

void TelegramGateway::sendDocument(ChatId chat, const std::string &path, const std::string &filename)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw StorageIOError("Cannot open " + path + " for sending");
    }
    std::ostringstream content;
    content << in.rdbuf();

    httplib::MultipartFormDataItems items = {
        {"chat_id", std::to_string(chat), "", ""},
        {"document", content.str(), filename, "application/octet-stream"},
    };

    auto client = makeClient(UPLOAD_TIMEOUT_SECONDS);
    auto res = client->Post(methodPath("sendDocument"), items);
    checkResponse("sendDocument", res);
}

void TelegramGateway::editMessageText(ChatId chat, std::int64_t message_id, const std::string &text)
{
    call("editMessageText", {{"chat_id", chat}, {"message_id", message_id}, {"text", text}});
}

void TelegramGateway::answerCallback(const std::string &callback_id)
{
    if (callback_id.empty())
    {
        return;
    }
    call("answerCallbackQuery", {{"callback_query_id", callback_id}});
}

void TelegramGateway::downloadFile(const std::string &file_id, const std::string &dest_path)
{
    nlohmann::json file;
    try
    {
        file = call("getFile", {{"file_id", file_id}});
    }
    catch (const TelegramApiError &e)
    {
        throw StorageIOError(std::string("getFile failed: ") + e.what());
    }

    const std::string file_path = file.value("file_path", "");
    if (file_path.empty())
    {
        throw StorageIOError("getFile returned no file_path for " + file_id);
    }

    std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw StorageIOError("Cannot open " + dest_path + " for writing");
    }

    auto client = makeClient(UPLOAD_TIMEOUT_SECONDS);
    auto res = client->Get("/file/bot" + token_ + "/" + file_path,
                           [&out](const char *data, size_t length)
                           {
                               out.write(data, static_cast<std::streamsize>(length));
                               return out.good();
                           });
    if (!res)
    {
        throw StorageIOError("download of " + file_id + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200)
    {
        throw StorageIOError("download of " + file_id + " failed with HTTP " + std::to_string(res->status));
    }
    out.flush();
    if (!out)
    {
        throw StorageIOError("write to " + dest_path + " failed");
    }
}
