#pragma once

#include <cstdint>
#include <optional>
#include <string>

using UserId = std::int64_t;
using ChatId = std::int64_t;

enum class MediaKind
{
    Video,
    Animation
};

enum class Decision
{
    SendOriginal,
    Compress
};

/**
 * @brief One downloaded upload awaiting the user's decision
 */
struct MediaItem
{
    std::string source_path;  // owned by the session until cleanup
    MediaKind kind = MediaKind::Video;
    std::string display_name; // filename used when sending back
    std::uint64_t sequence = 0; // update id of the upload, newer wins
};

/**
 * @brief Decision parsed from a button's callback token
 *
 * Tokens look like "compress:42". The sequence is absent for bare
 * "original" / "compress" tokens.
 */
struct DecisionToken
{
    Decision decision = Decision::SendOriginal;
    std::optional<std::uint64_t> sequence;
};

namespace MediaNaming
{
    const char *kindName(MediaKind kind);
    const char *decisionName(Decision decision);

    std::string defaultDisplayName(MediaKind kind);

    // Extension of the display name including the dot, lower-cased, or ""
    std::string extensionOf(const std::string &display_name);

    // Suffix for the transcoder output file
    std::string outputSuffixFor(MediaKind kind, const std::string &display_name);

    // Filename the compressed file is delivered under
    std::string compressedDisplayName(MediaKind kind, const std::string &display_name);

    std::string encodeToken(Decision decision, std::uint64_t sequence);
    std::optional<DecisionToken> parseToken(const std::string &token);
}
