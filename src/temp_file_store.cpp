#include "core/temp_file_store.hpp"
#include "core/bot_errors.hpp"
#include "logging/logger.hpp"
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <vector>
#include <unistd.h>
#include <stdlib.h>

namespace fs = std::filesystem;

namespace
{
    constexpr size_t MAX_SUFFIX_LENGTH = 16;
}

TempFileStore::TempFileStore(const std::string &directory)
{
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec)
    {
        throw StorageIOError("Cannot create temp directory " + directory + ": " + ec.message());
    }
    directory_ = fs::absolute(directory, ec).string();
    if (ec)
    {
        directory_ = directory;
    }
    Logger::debug("TempFileStore: using directory " + directory_);
}

TempFileStore::~TempFileStore()
{
    size_t released = releaseAll();
    if (released > 0)
    {
        Logger::warn("TempFileStore: released " + std::to_string(released) + " files still tracked at destruction");
    }
}

std::string TempFileStore::sanitizeSuffix(const std::string &suffix)
{
    if (suffix.empty() || suffix[0] != '.' || suffix.size() > MAX_SUFFIX_LENGTH)
    {
        return "";
    }
    for (size_t i = 1; i < suffix.size(); ++i)
    {
        if (!std::isalnum(static_cast<unsigned char>(suffix[i])))
        {
            return "";
        }
    }
    return suffix.size() > 1 ? suffix : "";
}

std::string TempFileStore::acquire(const std::string &suffix)
{
    std::string clean_suffix = sanitizeSuffix(suffix);
    std::string pattern = (fs::path(directory_) / (std::string(FILE_PREFIX) + "XXXXXX")).string() + clean_suffix;

    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemps(buffer.data(), static_cast<int>(clean_suffix.size()));
    if (fd < 0)
    {
        throw StorageIOError("Cannot create temp file in " + directory_ + ": " + std::strerror(errno));
    }
    close(fd);

    std::string path(buffer.data());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live_.insert(path);
    }
    Logger::debug("TempFileStore: acquired " + path);
    return path;
}

void TempFileStore::release(const std::string &path) noexcept
{
    try
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            live_.erase(path);
        }

        std::error_code ec;
        bool removed = fs::remove(path, ec);
        if (ec)
        {
            Logger::warn("TempFileStore: failed to delete " + path + ": " + ec.message());
        }
        else if (!removed)
        {
            Logger::debug("TempFileStore: " + path + " already gone");
        }
        else
        {
            Logger::debug("TempFileStore: released " + path);
        }
    }
    catch (const std::exception &e)
    {
        // Logging itself failed; cleanup stays best-effort.
        std::fprintf(stderr, "TempFileStore: release error: %s\n", e.what());
    }
}

size_t TempFileStore::releaseAll() noexcept
{
    std::unordered_set<std::string> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(live_);
    }
    for (const auto &path : remaining)
    {
        release(path);
    }
    return remaining.size();
}

size_t TempFileStore::purgeStale() noexcept
{
    size_t removed = 0;
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec))
    {
        const auto name = it->path().filename().string();
        if (name.rfind(FILE_PREFIX, 0) != 0 || isTracked(it->path().string()))
        {
            continue;
        }
        std::error_code remove_ec;
        if (fs::remove(it->path(), remove_ec))
        {
            ++removed;
        }
        else if (remove_ec)
        {
            Logger::warn("TempFileStore: cannot purge " + it->path().string() + ": " + remove_ec.message());
        }
    }
    if (ec)
    {
        Logger::warn("TempFileStore: cannot scan " + directory_ + ": " + ec.message());
    }
    if (removed > 0)
    {
        Logger::info("TempFileStore: purged " + std::to_string(removed) + " stale files from " + directory_);
    }
    return removed;
}

size_t TempFileStore::liveCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

bool TempFileStore::isTracked(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.count(path) > 0;
}
