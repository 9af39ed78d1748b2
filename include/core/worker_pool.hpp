#pragma once

#include <tbb/task_arena.h>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <string>

/**
 * @brief Fixed-size pool of worker threads backed by a TBB task arena
 *
 * Jobs are enqueued fire-and-forget into the arena, so submit() never
 * blocks the caller. A job's exception is stored in the future returned by
 * submit() and never reaches the TBB scheduler.
 */
class WorkerPool
{
public:
    /**
     * @param name Used in log messages
     * @param concurrency Number of jobs that may run at the same time (1-64)
     */
    WorkerPool(std::string name, int concurrency);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    /**
     * @brief Queue a job
     * @return Future completed when the job has run
     * @throws std::runtime_error after shutdown()
     */
    std::future<void> submit(std::function<void()> job);

    // Block until every queued and running job has finished
    void wait();

    // Refuse new jobs and wait for the queued ones
    void shutdown();

    size_t pending() const { return pending_.load(); }
    int concurrency() const { return concurrency_; }
    const std::string &name() const { return name_; }

    static bool validateConcurrency(int concurrency);

private:
    void jobFinished();

    std::string name_;
    int concurrency_;
    tbb::task_arena arena_;
    std::atomic<size_t> pending_{0};
    std::atomic<bool> accepting_{true};
    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
};
