#pragma once

#include "core/media_session_controller.hpp"
#include "core/messaging_gateway.hpp"
#include "core/worker_pool.hpp"
#include "telegram/update_parser.hpp"
#include <future>

/**
 * @brief Routes parsed updates to the controller on the event pool
 *
 * The polling thread only enqueues; downloads, replies and decisions run
 * on event workers so one slow user never holds up the others.
 */
class UpdateDispatcher
{
public:
    UpdateDispatcher(MessagingGateway &gateway, MediaSessionController &controller, WorkerPool &event_pool);

    // Returns a future completed once the event has been handled
    std::future<void> dispatch(const ParsedUpdate &update);

    void handleCommand(const CommandEvent &command);

private:
    MessagingGateway &gateway_;
    MediaSessionController &controller_;
    WorkerPool &event_pool_;
};
