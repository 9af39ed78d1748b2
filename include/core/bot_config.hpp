#pragma once

#include "core/poco_config_manager.hpp"
#include <string>

/**
 * @brief Typed runtime configuration of the bot
 *
 * Built from the PocoConfigManager tree plus the process environment.
 * The bot token is read from BOT_TOKEN only and never from a file.
 */
struct BotConfig
{
    std::string bot_token;
    std::string log_level = "INFO";
    std::string temp_dir;
    std::string ffmpeg_path = "ffmpeg";
    int transcode_workers = 2;
    int event_workers = 4;
    int transcode_timeout_seconds = 0; // 0 = no limit
    int poll_timeout_seconds = 30;
    std::string api_base_url = "https://api.telegram.org";
    int max_download_bytes = 20 * 1024 * 1024;

    /**
     * @brief Load config.json, falling back to config.yaml next to it
     * @param json_path Path of the JSON file
     * @return true if either file was loaded, false if defaults are in use
     */
    static bool loadFiles(PocoConfigManager &manager, const std::string &json_path);

    /**
     * @brief Build the typed configuration
     * @throws ConfigurationError if BOT_TOKEN is absent or a value is out of range
     */
    static BotConfig fromManager(const PocoConfigManager &manager);
};
