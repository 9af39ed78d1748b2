#include "core/worker_pool.hpp"
#include "logging/logger.hpp"
#include <memory>
#include <stdexcept>
#include <thread>

bool WorkerPool::validateConcurrency(int concurrency)
{
    if (concurrency < 1 || concurrency > 64)
    {
        Logger::warn("Worker count " + std::to_string(concurrency) + " is outside valid range [1-64]");
        return false;
    }

    unsigned hardware = std::thread::hardware_concurrency();
    if (hardware > 0 && static_cast<unsigned>(concurrency) > hardware * 2)
    {
        Logger::warn("Worker count " + std::to_string(concurrency) + " exceeds 2x hardware concurrency (" +
                     std::to_string(hardware) + "). This may cause performance degradation.");
    }
    return true;
}

WorkerPool::WorkerPool(std::string name, int concurrency)
    : name_(std::move(name)),
      concurrency_(validateConcurrency(concurrency) ? concurrency : 1),
      arena_(concurrency_, 0)
{
    Logger::info("Worker pool '" + name_ + "' initialized with " + std::to_string(concurrency_) + " workers");
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

std::future<void> WorkerPool::submit(std::function<void()> job)
{
    if (!accepting_.load())
    {
        throw std::runtime_error("Worker pool '" + name_ + "' is shut down");
    }

    auto task = std::make_shared<std::packaged_task<void()>>(std::move(job));
    std::future<void> done = task->get_future();

    pending_.fetch_add(1);
    arena_.enqueue([this, task]()
                   {
        (*task)();
        jobFinished(); });
    return done;
}

void WorkerPool::jobFinished()
{
    if (pending_.fetch_sub(1) == 1)
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        idle_cv_.notify_all();
    }
}

void WorkerPool::wait()
{
    std::unique_lock<std::mutex> lock(idle_mutex_);
    idle_cv_.wait(lock, [this]
                  { return pending_.load() == 0; });
}

void WorkerPool::shutdown()
{
    if (accepting_.exchange(false))
    {
        if (pending_.load() > 0)
        {
            Logger::info("Worker pool '" + name_ + "' waiting for " + std::to_string(pending_.load()) + " jobs");
        }
    }
    wait();
}
