#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <csignal>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    struct sigaction action = {};
    action.sa_handler = &ShutdownManager::handleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    for (int sig : {SIGINT, SIGTERM, SIGQUIT})
    {
        if (sigaction(sig, &action, nullptr) != 0)
        {
            Logger::warn("ShutdownManager: cannot install handler for signal " + std::to_string(sig));
        }
    }

    // A peer closing the connection mid-upload must not kill the process
    signal(SIGPIPE, SIG_IGN);

    startWatcher();
    Logger::info("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

ShutdownManager::CallbackId ShutdownManager::onShutdown(std::function<void()> callback)
{
    CallbackId id = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!shutdown_requested_.load())
        {
            id = next_callback_id_++;
            callbacks_.emplace_back(id, std::move(callback));
        }
    }
    if (id == 0)
    {
        callback();
    }
    return id;
}

void ShutdownManager::removeCallback(CallbackId id)
{
    std::unique_lock<std::mutex> lk(mutex_);
    for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it)
    {
        if (it->first == id)
        {
            callbacks_.erase(it);
            break;
        }
    }
    if (callbacks_thread_ != std::this_thread::get_id())
    {
        cv_.wait(lk, [this]
                 { return !callbacks_running_; });
    }
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("Signal received", sig);
                break;
            }
            if (shutdown_requested_.load())
            {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id())
    {
        watcher_.join();
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_in_progress_.exchange(true))
    {
        return;
    }

    last_signal_.store(signal_number);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    if (signal_number != 0)
    {
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", initiating graceful shutdown");
    }
    else
    {
        Logger::info("ShutdownManager: programmatic shutdown requested - " + reason);
    }

    runCallbacks();
}

void ShutdownManager::runCallbacks() noexcept
{
    std::vector<std::pair<CallbackId, std::function<void()>>> callbacks;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        callbacks.swap(callbacks_);
        callbacks_running_ = true;
        callbacks_thread_ = std::this_thread::get_id();
    }
    for (auto &entry : callbacks)
    {
        try
        {
            entry.second();
        }
        catch (const std::exception &e)
        {
            Logger::error("ShutdownManager: shutdown callback failed: " + std::string(e.what()));
        }
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);
        callbacks_running_ = false;
        callbacks_thread_ = std::thread::id();
    }
    cv_.notify_all();
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

bool ShutdownManager::waitForShutdownFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [this]
                        { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    shutdown_requested_.store(false);
    shutdown_in_progress_.store(false);
    last_signal_.store(0);

    signal_flag_ = 0;
    signal_num_ = 0;

    std::lock_guard<std::mutex> lk(mutex_);
    reason_.clear();
    callbacks_.clear();
    callbacks_running_ = false;
    callbacks_thread_ = std::thread::id();
}
