#pragma once

#include "core/media_item.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

/**
 * @brief Per-user pending media item, at most one per user
 *
 * Pure mapping state: the store never touches files. Whatever put() hands
 * back is the caller's to clean up. Every operation is atomic with respect
 * to the others.
 */
class SessionStore
{
public:
    struct PutResult
    {
        bool stored = false;
        // Item the caller must now destroy: the superseded one when stored,
        // the rejected incoming one otherwise
        std::optional<MediaItem> discarded;
    };

    /**
     * @brief Store item as the sole pending item for the user
     *
     * An item whose sequence is lower than the highest one ever put for
     * the user is refused, even after that newer item was taken, so a late
     * download never replaces or outlives a newer upload.
     */
    PutResult put(UserId user, MediaItem item);

    // Read and clear the entry for the user
    std::optional<MediaItem> take(UserId user);

    // Like take(), but only if the stored item has the given sequence
    std::optional<MediaItem> takeMatching(UserId user, std::uint64_t sequence);

    std::optional<MediaItem> peek(UserId user) const;
    bool contains(UserId user) const;
    size_t size() const;

    // Remove and return every pending item
    std::vector<MediaItem> drain();

private:
    mutable std::mutex mutex_;
    std::unordered_map<UserId, MediaItem> items_;
    // Highest sequence put per user; left alone by take() and drain()
    std::unordered_map<UserId, std::uint64_t> last_sequence_;
};
