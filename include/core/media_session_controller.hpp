#pragma once

#include "core/messaging_gateway.hpp"
#include "core/session_store.hpp"
#include "core/temp_file_store.hpp"
#include "core/transcode_engine.hpp"
#include "core/worker_pool.hpp"
#include <future>
#include <map>
#include <mutex>
#include <unordered_map>

/**
 * @brief Drives one media decision per user from upload to cleanup
 *
 * Upload: download into a temp file, record it as the user's pending item
 * (deleting any item it supersedes) and offer the two choices.
 * Decision: take the pending item, then send it unchanged or transcode it
 * on the transcode pool and send the result. Whatever the outcome, the
 * input file and any output file are released exactly once.
 *
 * Handlers may be called concurrently from several threads. Errors inside
 * one user's flow are reported to that user and never propagate.
 */
class MediaSessionController
{
public:
    enum class State
    {
        Idle,
        AwaitingDecision,
        Transcoding,
        Delivering
    };

    MediaSessionController(MessagingGateway &gateway,
                           SessionStore &sessions,
                           TempFileStore &temp_files,
                           TranscodeEngine &engine,
                           WorkerPool &transcode_pool,
                           std::int64_t max_download_bytes);

    MediaSessionController(const MediaSessionController &) = delete;
    MediaSessionController &operator=(const MediaSessionController &) = delete;

    void handleUpload(const UploadEvent &event);

    /**
     * @brief Act on a button press
     * @return Future that completes once the flow reached a terminal
     *         state. Already completed unless a transcode was queued.
     */
    std::future<void> handleDecision(const DecisionEvent &event);

    State stateFor(UserId user) const;

    // Release every pending item, returns how many there were
    size_t shutdown();

    static const char *stateName(State state);

    // Short, single-line form of an encoder diagnostic for the user
    static std::string summarizeDiagnostic(const std::string &diagnostic);

private:
    void ingest(const UploadEvent &event);
    void offerChoice(ChatId chat, const MediaItem &item);

    void deliverOriginal(const DecisionEvent &event, const MediaItem &item);
    void compressAndDeliver(const DecisionEvent &event, const MediaItem &item);

    // Prompt edit when the prompt message is known, plain text otherwise
    void reportStatus(const DecisionEvent &event, const std::string &text);
    void notify(ChatId chat, const std::string &text);

    void setActive(UserId user, std::uint64_t sequence, State state);
    void clearActive(UserId user, std::uint64_t sequence);

    MessagingGateway &gateway_;
    SessionStore &sessions_;
    TempFileStore &temp_files_;
    TranscodeEngine &engine_;
    WorkerPool &transcode_pool_;
    std::int64_t max_download_bytes_;

    mutable std::mutex active_mutex_;
    // Flows past the decision point, per user and upload sequence
    std::unordered_map<UserId, std::map<std::uint64_t, State>> active_;
};
