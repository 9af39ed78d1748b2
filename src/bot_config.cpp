#include "core/bot_config.hpp"
#include "core/bot_errors.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace
{
    std::string envOrEmpty(const char *name)
    {
        const char *value = std::getenv(name);
        return (value && *value) ? std::string(value) : std::string();
    }

    int readPositive(const PocoConfigManager &manager, const std::string &key, int def, int min_value)
    {
        int value = def;
        try
        {
            value = manager.getInt(key, def);
        }
        catch (const Poco::Exception &e)
        {
            throw ConfigurationError("Invalid value for " + key + ": " + e.displayText());
        }
        if (value < min_value)
        {
            throw ConfigurationError(key + " must be at least " + std::to_string(min_value) +
                                     ", got " + std::to_string(value));
        }
        return value;
    }
}

bool BotConfig::loadFiles(PocoConfigManager &manager, const std::string &json_path)
{
    if (manager.load(json_path))
    {
        Logger::info("Configuration loaded from " + json_path);
        return true;
    }

    fs::path yaml_path = fs::path(json_path).replace_extension(".yaml");
    if (manager.loadYaml(yaml_path.string()))
    {
        Logger::info("Configuration loaded from " + yaml_path.string() + " (fallback)");
        return true;
    }

    Logger::info("No configuration file found, using defaults");
    return false;
}

BotConfig BotConfig::fromManager(const PocoConfigManager &manager)
{
    BotConfig config;

    config.bot_token = envOrEmpty("BOT_TOKEN");
    if (config.bot_token.empty())
    {
        throw ConfigurationError("BOT_TOKEN environment variable is not set");
    }

    config.log_level = manager.getString("log_level", config.log_level);
    std::string env_level = envOrEmpty("CLIPBOT_LOG_LEVEL");
    if (!env_level.empty())
    {
        config.log_level = env_level;
    }
    if (!Logger::isValidLevel(config.log_level))
    {
        throw ConfigurationError("Unknown log_level '" + config.log_level +
                                 "', expected TRACE, DEBUG, INFO, WARN or ERROR");
    }

    config.temp_dir = manager.getString("temp_dir", "");
    if (config.temp_dir.empty())
    {
        config.temp_dir = (fs::temp_directory_path() / "clipbot").string();
    }

    config.ffmpeg_path = manager.getString("transcode.ffmpeg_path", config.ffmpeg_path);
    config.transcode_workers = readPositive(manager, "transcode.workers", config.transcode_workers, 1);
    config.transcode_timeout_seconds =
        readPositive(manager, "transcode.timeout_seconds", config.transcode_timeout_seconds, 0);
    config.event_workers = readPositive(manager, "events.workers", config.event_workers, 1);

    config.api_base_url = manager.getString("telegram.api_base_url", config.api_base_url);
    config.poll_timeout_seconds =
        readPositive(manager, "telegram.poll_timeout_seconds", config.poll_timeout_seconds, 0);
    config.max_download_bytes =
        readPositive(manager, "telegram.max_download_bytes", config.max_download_bytes, 1);

    return config;
}
