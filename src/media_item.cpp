#include "core/media_item.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace MediaNaming
{
    const char *kindName(MediaKind kind)
    {
        switch (kind)
        {
        case MediaKind::Video:
            return "video";
        case MediaKind::Animation:
            return "animation";
        }
        return "unknown";
    }

    const char *decisionName(Decision decision)
    {
        switch (decision)
        {
        case Decision::SendOriginal:
            return "original";
        case Decision::Compress:
            return "compress";
        }
        return "unknown";
    }

    std::string defaultDisplayName(MediaKind kind)
    {
        return kind == MediaKind::Animation ? "animation.gif" : "video.mp4";
    }

    std::string extensionOf(const std::string &display_name)
    {
        auto ext = fs::path(display_name).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

    std::string outputSuffixFor(MediaKind kind, const std::string &display_name)
    {
        switch (kind)
        {
        case MediaKind::Video:
        case MediaKind::Animation:
            return ".mp4";
        }
        return extensionOf(display_name);
    }

    std::string compressedDisplayName(MediaKind kind, const std::string &display_name)
    {
        std::string stem = fs::path(display_name).stem().string();
        if (stem.empty())
        {
            stem = fs::path(defaultDisplayName(kind)).stem().string();
        }
        return stem + outputSuffixFor(kind, display_name);
    }

    std::string encodeToken(Decision decision, std::uint64_t sequence)
    {
        return std::string(decisionName(decision)) + ":" + std::to_string(sequence);
    }

    std::optional<DecisionToken> parseToken(const std::string &token)
    {
        std::string name = token;
        std::string seq_part;
        auto colon = token.find(':');
        if (colon != std::string::npos)
        {
            name = token.substr(0, colon);
            seq_part = token.substr(colon + 1);
        }

        DecisionToken parsed;
        if (name == "original")
            parsed.decision = Decision::SendOriginal;
        else if (name == "compress")
            parsed.decision = Decision::Compress;
        else
            return std::nullopt;

        if (colon != std::string::npos)
        {
            if (seq_part.empty() || !std::all_of(seq_part.begin(), seq_part.end(),
                                                 [](unsigned char c)
                                                 { return std::isdigit(c) != 0; }))
            {
                return std::nullopt;
            }
            try
            {
                parsed.sequence = std::stoull(seq_part);
            }
            catch (const std::out_of_range &)
            {
                return std::nullopt;
            }
        }
        return parsed;
    }
}
