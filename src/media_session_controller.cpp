#include "core/media_session_controller.hpp"
#include "core/bot_errors.hpp"
#include "core/bot_messages.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace
{
    constexpr size_t MAX_DIAGNOSTIC_LENGTH = 300;

    template <typename F>
    class ScopeExit
    {
    public:
        explicit ScopeExit(F fn) : fn_(std::move(fn)) {}
        ~ScopeExit() { fn_(); }
        ScopeExit(const ScopeExit &) = delete;
        ScopeExit &operator=(const ScopeExit &) = delete;

    private:
        F fn_;
    };

    std::future<void> completedFuture()
    {
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }

    std::string userTag(UserId user)
    {
        return "user " + std::to_string(user);
    }

    bool fileHasContent(const std::string &path)
    {
        std::error_code ec;
        auto size = fs::file_size(path, ec);
        return !ec && size > 0;
    }
}

MediaSessionController::MediaSessionController(MessagingGateway &gateway,
                                               SessionStore &sessions,
                                               TempFileStore &temp_files,
                                               TranscodeEngine &engine,
                                               WorkerPool &transcode_pool,
                                               std::int64_t max_download_bytes)
    : gateway_(gateway),
      sessions_(sessions),
      temp_files_(temp_files),
      engine_(engine),
      transcode_pool_(transcode_pool),
      max_download_bytes_(max_download_bytes)
{
}

const char *MediaSessionController::stateName(State state)
{
    switch (state)
    {
    case State::Idle:
        return "Idle";
    case State::AwaitingDecision:
        return "AwaitingDecision";
    case State::Transcoding:
        return "Transcoding";
    case State::Delivering:
        return "Delivering";
    }
    return "Unknown";
}

std::string MediaSessionController::summarizeDiagnostic(const std::string &diagnostic)
{
    // ffmpeg puts the actual error on its last non-empty line
    size_t end = diagnostic.find_last_not_of(" \r\n\t");
    if (end == std::string::npos)
    {
        return "";
    }
    size_t start = diagnostic.find_last_of('\n', end);
    start = (start == std::string::npos) ? 0 : start + 1;

    std::string line = diagnostic.substr(start, end - start + 1);
    if (line.size() > MAX_DIAGNOSTIC_LENGTH)
    {
        line = line.substr(line.size() - MAX_DIAGNOSTIC_LENGTH);
    }
    return line;
}

void MediaSessionController::handleUpload(const UploadEvent &event)
{
    try
    {
        ingest(event);
    }
    catch (const UnsupportedMediaError &e)
    {
        Logger::info("Upload from " + userTag(event.user_id) + " rejected: " + e.what());
        notify(event.chat_id, BotMessages::UNSUPPORTED_MEDIA);
    }
    catch (const StorageIOError &e)
    {
        Logger::error("Upload from " + userTag(event.user_id) + " aborted: " + e.what());
        notify(event.chat_id, BotMessages::DOWNLOAD_FAILED);
    }
    catch (const std::exception &e)
    {
        Logger::error("Unexpected error handling upload from " + userTag(event.user_id) + ": " + e.what());
        notify(event.chat_id, BotMessages::DOWNLOAD_FAILED);
    }
}

void MediaSessionController::ingest(const UploadEvent &event)
{
    if (!event.kind)
    {
        throw UnsupportedMediaError("attachment type '" + event.attachment_type + "' is not a video or animation");
    }

    if (event.declared_size > max_download_bytes_)
    {
        Logger::info("Upload from " + userTag(event.user_id) + " refused: " + std::to_string(event.declared_size) +
                     " bytes exceeds limit of " + std::to_string(max_download_bytes_));
        notify(event.chat_id, BotMessages::FILE_TOO_LARGE);
        return;
    }

    const MediaKind kind = *event.kind;
    const std::string display_name =
        event.suggested_name.empty() ? MediaNaming::defaultDisplayName(kind) : event.suggested_name;

    TempFileGuard download(temp_files_, temp_files_.acquire(MediaNaming::extensionOf(display_name)));
    try
    {
        gateway_.downloadFile(event.file_id, download.path());
    }
    catch (const StorageIOError &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        throw StorageIOError("download of " + event.file_id + " failed: " + e.what());
    }

    if (!fileHasContent(download.path()))
    {
        throw StorageIOError("download of " + event.file_id + " produced an empty file");
    }

    MediaItem item;
    item.source_path = download.path();
    item.kind = kind;
    item.display_name = display_name;
    item.sequence = event.sequence;

    auto put = sessions_.put(event.user_id, item);
    if (!put.stored)
    {
        // A newer upload is already pending; ours is stale
        Logger::info("Upload " + std::to_string(event.sequence) + " from " + userTag(event.user_id) +
                     " arrived after a newer one, dropping it");
        return;
    }
    download.dismiss();

    if (put.discarded)
    {
        Logger::info("Upload " + std::to_string(event.sequence) + " from " + userTag(event.user_id) +
                     " supersedes upload " + std::to_string(put.discarded->sequence));
        temp_files_.release(put.discarded->source_path);
    }

    Logger::info("Stored " + std::string(MediaNaming::kindName(kind)) + " '" + display_name + "' for " +
                 userTag(event.user_id) + ", awaiting decision");
    offerChoice(event.chat_id, item);
}

void MediaSessionController::offerChoice(ChatId chat, const MediaItem &item)
{
    std::vector<ChoiceButton> buttons = {
        {BotMessages::BUTTON_ORIGINAL, MediaNaming::encodeToken(Decision::SendOriginal, item.sequence)},
        {BotMessages::BUTTON_COMPRESS, MediaNaming::encodeToken(Decision::Compress, item.sequence)},
    };
    try
    {
        gateway_.sendChoicePrompt(chat, BotMessages::CHOOSE_ACTION, buttons);
    }
    catch (const std::exception &e)
    {
        // The item stays pending until superseded or drained at shutdown
        Logger::error("Failed to send choice prompt to chat " + std::to_string(chat) + ": " + e.what());
    }
}

std::future<void> MediaSessionController::handleDecision(const DecisionEvent &event)
{
    try
    {
        gateway_.answerCallback(event.callback_id);
    }
    catch (const std::exception &e)
    {
        Logger::warn("Failed to answer callback " + event.callback_id + ": " + e.what());
    }

    auto token = MediaNaming::parseToken(event.token);
    if (!token)
    {
        Logger::warn("Unknown choice token '" + event.token + "' from " + userTag(event.user_id));
        reportStatus(event, BotMessages::UNKNOWN_CHOICE);
        return completedFuture();
    }

    std::optional<MediaItem> item = token->sequence ? sessions_.takeMatching(event.user_id, *token->sequence)
                                                    : sessions_.take(event.user_id);
    try
    {
        if (!item)
        {
            throw MissingSessionError("no pending item for " + userTag(event.user_id));
        }
        std::error_code ec;
        if (!fs::exists(item->source_path, ec))
        {
            temp_files_.release(item->source_path);
            throw MissingSessionError("pending file " + item->source_path + " is unavailable" +
                                      (ec ? ": " + ec.message() : std::string()));
        }
    }
    catch (const MissingSessionError &e)
    {
        Logger::info("Decision '" + event.token + "' ignored: " + e.what());
        reportStatus(event, BotMessages::NO_STORED_FILE);
        return completedFuture();
    }

    Logger::info(userTag(event.user_id) + " chose '" + MediaNaming::decisionName(token->decision) + "' for '" +
                 item->display_name + "'");

    if (token->decision == Decision::SendOriginal)
    {
        deliverOriginal(event, *item);
        return completedFuture();
    }

    setActive(event.user_id, item->sequence, State::Transcoding);
    reportStatus(event, BotMessages::COMPRESSING);
    try
    {
        MediaItem queued = *item;
        return transcode_pool_.submit([this, event, queued]()
                                      { compressAndDeliver(event, queued); });
    }
    catch (const std::exception &e)
    {
        Logger::error("Cannot queue transcode for " + userTag(event.user_id) + ": " + e.what());
        temp_files_.release(item->source_path);
        clearActive(event.user_id, item->sequence);
        reportStatus(event, std::string(BotMessages::COMPRESSION_FAILED) + e.what());
        return completedFuture();
    }
}

void MediaSessionController::deliverOriginal(const DecisionEvent &event, const MediaItem &item)
{
    TempFileGuard input(temp_files_, item.source_path);
    setActive(event.user_id, item.sequence, State::Delivering);
    ScopeExit done([this, &event, &item]()
                   { clearActive(event.user_id, item.sequence); });

    reportStatus(event, BotMessages::SENDING_ORIGINAL);
    try
    {
        gateway_.sendDocument(event.chat_id, input.path(), item.display_name);
        reportStatus(event, BotMessages::ORIGINAL_SENT);
        Logger::info("Sent original '" + item.display_name + "' to " + userTag(event.user_id));
    }
    catch (const std::exception &e)
    {
        Logger::error("Sending original to " + userTag(event.user_id) + " failed: " + e.what());
        reportStatus(event, BotMessages::DELIVERY_FAILED);
    }
}

void MediaSessionController::compressAndDeliver(const DecisionEvent &event, const MediaItem &item)
{
    TempFileGuard input(temp_files_, item.source_path);
    ScopeExit done([this, &event, &item]()
                   { clearActive(event.user_id, item.sequence); });

    std::string output_path;
    try
    {
        output_path = temp_files_.acquire(MediaNaming::outputSuffixFor(item.kind, item.display_name));
    }
    catch (const StorageIOError &e)
    {
        Logger::error("No output file for " + userTag(event.user_id) + ": " + e.what());
        reportStatus(event, std::string(BotMessages::COMPRESSION_FAILED) + e.what());
        return;
    }
    TempFileGuard output(temp_files_, output_path);

    try
    {
        engine_.transcode(input.path(), output.path());
    }
    catch (const TranscodeError &e)
    {
        std::string detail = summarizeDiagnostic(e.diagnostic());
        std::string message = std::string(BotMessages::COMPRESSION_FAILED) + e.what();
        if (!detail.empty())
        {
            message += " (" + detail + ")";
        }
        Logger::error("Transcode for " + userTag(event.user_id) + " failed: " + e.what());
        reportStatus(event, message);
        return;
    }

    setActive(event.user_id, item.sequence, State::Delivering);
    const std::string delivered_name = MediaNaming::compressedDisplayName(item.kind, item.display_name);
    try
    {
        gateway_.sendDocument(event.chat_id, output.path(), delivered_name);
        reportStatus(event, BotMessages::COMPRESSED_SENT);
        Logger::info("Sent compressed '" + delivered_name + "' to " + userTag(event.user_id));
    }
    catch (const std::exception &e)
    {
        Logger::error("Sending compressed file to " + userTag(event.user_id) + " failed: " + e.what());
        reportStatus(event, BotMessages::DELIVERY_FAILED);
    }
}

void MediaSessionController::reportStatus(const DecisionEvent &event, const std::string &text)
{
    if (event.message_id == 0)
    {
        notify(event.chat_id, text);
        return;
    }
    try
    {
        gateway_.editMessageText(event.chat_id, event.message_id, text);
    }
    catch (const std::exception &e)
    {
        Logger::warn("Failed to edit message " + std::to_string(event.message_id) + ": " + e.what());
        notify(event.chat_id, text);
    }
}

void MediaSessionController::notify(ChatId chat, const std::string &text)
{
    try
    {
        gateway_.sendText(chat, text);
    }
    catch (const std::exception &e)
    {
        Logger::warn("Failed to send text to chat " + std::to_string(chat) + ": " + e.what());
    }
}

void MediaSessionController::setActive(UserId user, std::uint64_t sequence, State state)
{
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_[user][sequence] = state;
}

void MediaSessionController::clearActive(UserId user, std::uint64_t sequence)
{
    std::lock_guard<std::mutex> lock(active_mutex_);
    auto it = active_.find(user);
    if (it == active_.end())
    {
        return;
    }
    it->second.erase(sequence);
    if (it->second.empty())
    {
        active_.erase(it);
    }
}

MediaSessionController::State MediaSessionController::stateFor(UserId user) const
{
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        auto it = active_.find(user);
        if (it != active_.end() && !it->second.empty())
        {
            return it->second.rbegin()->second;
        }
    }
    return sessions_.contains(user) ? State::AwaitingDecision : State::Idle;
}

size_t MediaSessionController::shutdown()
{
    auto pending = sessions_.drain();
    for (const auto &item : pending)
    {
        temp_files_.release(item.source_path);
    }
    if (!pending.empty())
    {
        Logger::info("Released " + std::to_string(pending.size()) + " pending uploads at shutdown");
    }
    return pending.size();
}
