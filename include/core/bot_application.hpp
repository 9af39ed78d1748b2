#pragma once

#include "core/bot_config.hpp"
#include "core/media_session_controller.hpp"
#include "core/session_store.hpp"
#include "core/shutdown_manager.hpp"
#include "core/temp_file_store.hpp"
#include "core/transcode_engine.hpp"
#include "core/update_dispatcher.hpp"
#include "core/worker_pool.hpp"
#include "telegram/telegram_gateway.hpp"
#include <chrono>
#include <cstdint>

/**
 * @brief Owns every component of the bot and runs the long-poll loop
 *
 * run() returns once ShutdownManager reports a shutdown request and all
 * in-flight work has been drained.
 */
class BotApplication
{
public:
    explicit BotApplication(const BotConfig &config);
    ~BotApplication();

    BotApplication(const BotApplication &) = delete;
    BotApplication &operator=(const BotApplication &) = delete;

    // Returns the process exit code
    int run();

    // Stop polling, drain both pools and release every temporary file
    void shutdown();

    // Delay before retrying after the given number of consecutive poll failures
    static std::chrono::milliseconds backoffFor(int consecutive_failures);

private:
    void pollLoop();
    void pollOnce();

    BotConfig config_;
    TempFileStore temp_files_;
    SessionStore sessions_;
    TranscodeEngine engine_;
    WorkerPool transcode_pool_;
    WorkerPool event_pool_;
    TelegramGateway gateway_;
    MediaSessionController controller_;
    UpdateDispatcher dispatcher_;

    std::uint64_t next_offset_ = 0;
    ShutdownManager::CallbackId stop_callback_ = 0;
    bool shut_down_ = false;
};
