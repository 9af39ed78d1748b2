#include "core/bot_application.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include "telegram/update_parser.hpp"
#include <algorithm>

namespace
{
    constexpr int BASE_BACKOFF_MS = 500;
    constexpr int MAX_BACKOFF_MS = 30000;
}

BotApplication::BotApplication(const BotConfig &config)
    : config_(config),
      temp_files_(config.temp_dir),
      engine_(std::make_shared<PosixProcessRunner>(), config.ffmpeg_path,
              std::chrono::seconds(config.transcode_timeout_seconds)),
      transcode_pool_("transcode", config.transcode_workers),
      event_pool_("events", config.event_workers),
      gateway_(config.api_base_url, config.bot_token, config.poll_timeout_seconds),
      controller_(gateway_, sessions_, temp_files_, engine_, transcode_pool_, config.max_download_bytes),
      dispatcher_(gateway_, controller_, event_pool_)
{
}

BotApplication::~BotApplication()
{
    shutdown();
}

std::chrono::milliseconds BotApplication::backoffFor(int consecutive_failures)
{
    if (consecutive_failures <= 0)
        return std::chrono::milliseconds(0);

    long long delay = BASE_BACKOFF_MS;
    for (int i = 1; i < consecutive_failures && delay < MAX_BACKOFF_MS; ++i)
        delay *= 2;
    return std::chrono::milliseconds(std::min<long long>(delay, MAX_BACKOFF_MS));
}

int BotApplication::run()
{
    temp_files_.purgeStale();

    if (!engine_.isAvailable())
    {
        Logger::warn("ffmpeg not usable at '" + engine_.ffmpegPath() + "', compression requests will fail");
    }

    try
    {
        std::string username = gateway_.getMe();
        Logger::info("Authorized as @" + username);
    }
    catch (const TelegramApiError &e)
    {
        Logger::error("Bot token check failed: " + std::string(e.what()));
        return 1;
    }

    auto &shutdown_manager = ShutdownManager::getInstance();
    stop_callback_ = shutdown_manager.onShutdown([this]()
                                                 { gateway_.stop(); });

    Logger::info("Polling for updates (transcode workers: " + std::to_string(transcode_pool_.concurrency()) +
                 ", event workers: " + std::to_string(event_pool_.concurrency()) + ")");
    pollLoop();

    Logger::info("Shutdown requested: " + shutdown_manager.getReason());
    shutdown();
    return 0;
}

void BotApplication::pollLoop()
{
    auto &shutdown_manager = ShutdownManager::getInstance();
    int failures = 0;

    while (!shutdown_manager.isShutdownRequested())
    {
        try
        {
            pollOnce();
            failures = 0;
        }
        catch (const std::exception &e)
        {
            if (shutdown_manager.isShutdownRequested())
                break;

            ++failures;
            auto delay = backoffFor(failures);
            Logger::error("Polling failed (" + std::to_string(failures) + " in a row), retrying in " +
                          std::to_string(delay.count()) + "ms: " + e.what());
            shutdown_manager.waitForShutdownFor(delay);
        }
    }
}

void BotApplication::pollOnce()
{
    auto response = gateway_.getUpdates(next_offset_);
    auto updates = UpdateParser::parseResponse(response);

    for (const auto &update : updates)
    {
        next_offset_ = std::max(next_offset_, update.update_id + 1);
        // Handlers report their own failures, the future is only needed by tests
        dispatcher_.dispatch(update);
    }
}

void BotApplication::shutdown()
{
    if (shut_down_)
        return;
    shut_down_ = true;

    if (stop_callback_ != 0)
    {
        ShutdownManager::getInstance().removeCallback(stop_callback_);
        stop_callback_ = 0;
    }
    gateway_.stop();

    // Event jobs may still hand work to the transcode pool, so drain them first
    event_pool_.shutdown();
    transcode_pool_.shutdown();

    size_t pending = controller_.shutdown();
    size_t leftover = temp_files_.releaseAll();
    Logger::info("Shutdown complete: released " + std::to_string(pending) + " pending uploads and " +
                 std::to_string(leftover) + " leftover temporary files");
}
