#pragma once

#include <mutex>
#include <string>
#include <unordered_set>

/**
 * @brief Creates, tracks and deletes transient files in one directory
 *
 * Every path handed out by acquire() is unique in the process and stays
 * tracked until release(). Deletion never throws: failures are logged and
 * swallowed so cleanup cannot block delivery of a result.
 */
class TempFileStore
{
public:
    static constexpr const char *FILE_PREFIX = "clipbot-";

    /**
     * @param directory Directory for the files, created if missing
     * @throws StorageIOError if the directory cannot be created
     */
    explicit TempFileStore(const std::string &directory);
    ~TempFileStore();

    TempFileStore(const TempFileStore &) = delete;
    TempFileStore &operator=(const TempFileStore &) = delete;

    /**
     * @brief Create a new empty file
     * @param suffix Extension including the dot (".mp4"), may be empty
     * @return Absolute path of the created file
     * @throws StorageIOError if the file cannot be created
     */
    std::string acquire(const std::string &suffix);

    /**
     * @brief Delete a file if present. Idempotent, never throws.
     */
    void release(const std::string &path) noexcept;

    // Release every file still tracked, returns how many were tracked
    size_t releaseAll() noexcept;

    // Remove leftover files carrying our prefix from an earlier run
    size_t purgeStale() noexcept;

    size_t liveCount() const;
    bool isTracked(const std::string &path) const;
    const std::string &directory() const { return directory_; }

    // Keeps only characters safe for a filename extension
    static std::string sanitizeSuffix(const std::string &suffix);

private:
    std::string directory_;
    mutable std::mutex mutex_;
    std::unordered_set<std::string> live_;
};

/**
 * @brief Releases a TempFileStore path when it goes out of scope
 */
class TempFileGuard
{
public:
    TempFileGuard(TempFileStore &store, std::string path)
        : store_(&store), path_(std::move(path)) {}

    ~TempFileGuard() { reset(); }

    TempFileGuard(TempFileGuard &&other) noexcept
        : store_(other.store_), path_(std::move(other.path_))
    {
        other.path_.clear();
    }

    TempFileGuard(const TempFileGuard &) = delete;
    TempFileGuard &operator=(const TempFileGuard &) = delete;
    TempFileGuard &operator=(TempFileGuard &&) = delete;

    const std::string &path() const { return path_; }

    // Stop owning the path without deleting it
    std::string dismiss() noexcept
    {
        std::string path = std::move(path_);
        path_.clear();
        return path;
    }

    // Release now instead of at scope exit
    void reset() noexcept
    {
        if (!path_.empty())
        {
            store_->release(path_);
            path_.clear();
        }
    }

private:
    TempFileStore *store_;
    std::string path_;
};
