#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

/**
 * Process-wide shutdown coordination.
 * - SIGINT/SIGTERM/SIGQUIT handlers only set sig_atomic_t flags
 * - A watcher thread turns those flags into a shutdown request
 * - Callbacks registered with onShutdown() run once, on the requesting thread
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    // Install signal handlers and start the watcher thread
    void installSignalHandlers();

    using CallbackId = std::uint64_t;

    /**
     * @brief Register work to do when shutdown is requested, e.g. interrupting a long poll
     *
     * Runs the callback right away if shutdown was already requested and
     * returns 0 in that case.
     */
    CallbackId onShutdown(std::function<void()> callback);

    // Unregister a callback; waits if callbacks are running on another thread
    void removeCallback(CallbackId id);

    // Safe from any thread except a signal handler
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    void waitForShutdown();

    // Wait at most timeout, returns true if shutdown was requested
    bool waitForShutdownFor(std::chrono::milliseconds timeout);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();
    void runCallbacks() noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_in_progress_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::pair<CallbackId, std::function<void()>>> callbacks_;
    CallbackId next_callback_id_ = 1;
    bool callbacks_running_ = false;
    std::thread::id callbacks_thread_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
