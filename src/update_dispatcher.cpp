#include "core/update_dispatcher.hpp"
#include "core/bot_messages.hpp"
#include "logging/logger.hpp"

UpdateDispatcher::UpdateDispatcher(MessagingGateway &gateway, MediaSessionController &controller, WorkerPool &event_pool)
    : gateway_(gateway), controller_(controller), event_pool_(event_pool)
{
}

std::future<void> UpdateDispatcher::dispatch(const ParsedUpdate &update)
{
    switch (update.type)
    {
    case ParsedUpdate::Type::Upload:
    {
        UploadEvent event = update.upload;
        return event_pool_.submit([this, event]()
                                  { controller_.handleUpload(event); });
    }
    case ParsedUpdate::Type::Decision:
    {
        DecisionEvent event = update.decision;
        return event_pool_.submit([this, event]()
                                  { controller_.handleDecision(event); });
    }
    case ParsedUpdate::Type::Command:
    {
        CommandEvent event = update.command;
        return event_pool_.submit([this, event]()
                                  { handleCommand(event); });
    }
    case ParsedUpdate::Type::Ignored:
        break;
    }

    Logger::debug("Ignoring update " + std::to_string(update.update_id));
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

void UpdateDispatcher::handleCommand(const CommandEvent &command)
{
    const char *reply = nullptr;
    if (command.command == "start")
        reply = BotMessages::START;
    else if (command.command == "help")
        reply = BotMessages::HELP;

    if (!reply)
    {
        Logger::debug("Unknown command /" + command.command + " from user " + std::to_string(command.user_id));
        return;
    }

    try
    {
        gateway_.sendText(command.chat_id, reply);
    }
    catch (const std::exception &e)
    {
        Logger::warn("Failed to answer /" + command.command + ": " + e.what());
    }
}
