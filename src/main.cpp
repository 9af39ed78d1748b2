#include "core/bot_application.hpp"
#include "core/bot_config.hpp"
#include "core/bot_errors.hpp"
#include "core/poco_config_manager.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

static void printUsage(const char *program)
{
    std::cout << "clipbot - video and GIF compression bot" << std::endl;
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config, -c <path>   JSON config file (default: config/config.json)" << std::endl;
    std::cout << "  --help, -h            Show this help message" << std::endl;
    std::cout << "Environment:" << std::endl;
    std::cout << "  BOT_TOKEN             Telegram Bot API token (required)" << std::endl;
    std::cout << "  CLIPBOT_LOG_LEVEL     Overrides log_level from the config file" << std::endl;
}

int main(int argc, char *argv[])
{
    std::string config_path = "config/config.json";

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= argc)
            {
                std::cerr << arg << " requires a path" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        }
        else
        {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // Initialize coordinated signal handling FIRST
    ShutdownManager::getInstance().installSignalHandlers();

    auto &config_manager = PocoConfigManager::getInstance();
    BotConfig::loadFiles(config_manager, config_path);

    BotConfig config;
    try
    {
        config = BotConfig::fromManager(config_manager);
    }
    catch (const ConfigurationError &e)
    {
        Logger::error("Configuration error: " + std::string(e.what()));
        return 1;
    }

    Logger::init(config.log_level);
    Logger::info("Starting clipbot (temp dir: " + config.temp_dir + ")");

    try
    {
        BotApplication app(config);
        int code = app.run();
        Logger::info("clipbot stopped");
        return code;
    }
    catch (const std::exception &e)
    {
        Logger::error("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
