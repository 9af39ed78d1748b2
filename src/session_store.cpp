#include "core/session_store.hpp"

SessionStore::PutResult SessionStore::put(UserId user, MediaItem item)
{
    PutResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    // The mark outlives the entry, so an upload older than one already
    // taken is refused as well
    auto mark = last_sequence_.find(user);
    if (mark != last_sequence_.end() && item.sequence < mark->second)
    {
        result.discarded = std::move(item);
        return result;
    }
    last_sequence_[user] = item.sequence;

    auto it = items_.find(user);
    if (it == items_.end())
    {
        items_.emplace(user, std::move(item));
        result.stored = true;
        return result;
    }

    result.discarded = std::move(it->second);
    it->second = std::move(item);
    result.stored = true;
    return result;
}

std::optional<MediaItem> SessionStore::take(UserId user)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(user);
    if (it == items_.end())
    {
        return std::nullopt;
    }
    MediaItem item = std::move(it->second);
    items_.erase(it);
    return item;
}

std::optional<MediaItem> SessionStore::takeMatching(UserId user, std::uint64_t sequence)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(user);
    if (it == items_.end() || it->second.sequence != sequence)
    {
        return std::nullopt;
    }
    MediaItem item = std::move(it->second);
    items_.erase(it);
    return item;
}

std::optional<MediaItem> SessionStore::peek(UserId user) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(user);
    if (it == items_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

bool SessionStore::contains(UserId user) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.count(user) > 0;
}

size_t SessionStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

std::vector<MediaItem> SessionStore::drain()
{
    std::vector<MediaItem> drained;
    std::lock_guard<std::mutex> lock(mutex_);
    drained.reserve(items_.size());
    for (auto &entry : items_)
    {
        drained.push_back(std::move(entry.second));
    }
    items_.clear();
    return drained;
}
