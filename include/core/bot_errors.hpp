#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Root of every error raised by the bot core
 */
class BotError : public std::runtime_error
{
public:
    explicit BotError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Upload is neither a video nor an animation
 */
class UnsupportedMediaError : public BotError
{
public:
    explicit UnsupportedMediaError(const std::string &message) : BotError(message) {}
};

/**
 * @brief Decision arrived with no pending item for the user
 */
class MissingSessionError : public BotError
{
public:
    explicit MissingSessionError(const std::string &message) : BotError(message) {}
};

/**
 * @brief External encoder failed
 *
 * Carries the encoder's error stream and its exit status. An exit status of
 * -1 means the process never ran or was killed.
 */
class TranscodeError : public BotError
{
public:
    TranscodeError(const std::string &message, const std::string &diagnostic, int exit_status = -1)
        : BotError(message), diagnostic_(diagnostic), exit_status_(exit_status) {}

    const std::string &diagnostic() const noexcept { return diagnostic_; }
    int exitStatus() const noexcept { return exit_status_; }

private:
    std::string diagnostic_;
    int exit_status_;
};

/**
 * @brief Download, create or delete failure on temporary storage
 */
class StorageIOError : public BotError
{
public:
    explicit StorageIOError(const std::string &message) : BotError(message) {}
};

/**
 * @brief Missing or invalid startup configuration
 */
class ConfigurationError : public BotError
{
public:
    explicit ConfigurationError(const std::string &message) : BotError(message) {}
};
