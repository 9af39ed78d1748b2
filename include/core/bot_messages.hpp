#pragma once

// User-visible texts
namespace BotMessages
{
    constexpr const char *START =
        "Hi! Send me a video or a GIF and I will offer to send back the original or a compressed copy.";
    constexpr const char *HELP =
        "Commands: /start, /help. Send a video or GIF to get started.";

    constexpr const char *CHOOSE_ACTION = "What should I do with this file?";
    constexpr const char *BUTTON_ORIGINAL = "Send original";
    constexpr const char *BUTTON_COMPRESS = "Compress and send smaller";

    constexpr const char *UNSUPPORTED_MEDIA =
        "I couldn't find a video or GIF in that message. Send a video file or a GIF.";
    constexpr const char *NO_STORED_FILE = "No file is currently stored. Send a new file.";
    constexpr const char *UNKNOWN_CHOICE = "Unknown choice, please use the buttons.";
    constexpr const char *DOWNLOAD_FAILED = "Could not download your file, please send it again.";
    constexpr const char *FILE_TOO_LARGE = "This file is too large for me to download.";

    constexpr const char *SENDING_ORIGINAL = "Sending the original file...";
    constexpr const char *ORIGINAL_SENT = "Original file sent.";
    constexpr const char *COMPRESSING = "Compressing, please wait...";
    constexpr const char *COMPRESSED_SENT = "Compressed file sent.";
    constexpr const char *COMPRESSION_FAILED = "Compression failed: ";
    constexpr const char *DELIVERY_FAILED = "Could not send the file, please try again.";
}
