#include "core/transcode_engine.hpp"
#include "core/bot_errors.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace
{
    bool isNonEmptyFile(const std::string &path)
    {
        std::error_code ec;
        return fs::is_regular_file(path, ec) && fs::file_size(path, ec) > 0 && !ec;
    }
}

TranscodeEngine::TranscodeEngine(std::shared_ptr<ProcessRunner> runner,
                                 std::string ffmpeg_path,
                                 std::chrono::seconds timeout)
    : runner_(std::move(runner)), ffmpeg_path_(std::move(ffmpeg_path)), timeout_(timeout)
{
}

std::string TranscodeEngine::scaleFilter()
{
    return "scale='min(" + std::to_string(MAX_WIDTH) + ",iw)':'min(" + std::to_string(MAX_HEIGHT) +
           ",ih)':force_original_aspect_ratio=decrease";
}

std::vector<std::string> TranscodeEngine::buildArguments(const std::string &input_path,
                                                         const std::string &output_path) const
{
    return {
        ffmpeg_path_,
        "-y",
        "-i", input_path,
        "-vf", scaleFilter(),
        "-c:v", VIDEO_CODEC,
        "-preset", PRESET,
        "-crf", std::to_string(CRF),
        "-c:a", AUDIO_CODEC,
        "-b:a", AUDIO_BITRATE,
        output_path,
    };
}

std::string TranscodeEngine::transcode(const std::string &input_path, const std::string &output_path) const
{
    if (!isNonEmptyFile(input_path))
    {
        throw TranscodeError("Input file is missing or empty", input_path);
    }

    std::error_code ec;
    fs::path parent = fs::path(output_path).parent_path();
    if (!parent.empty() && !fs::is_directory(parent, ec))
    {
        throw TranscodeError("Output directory does not exist", parent.string());
    }

    auto args = buildArguments(input_path, output_path);
    Logger::info("Running ffmpeg: " + describeCommand(args));

    auto started = std::chrono::steady_clock::now();
    ProcessResult result = runner_->run(args, timeout_);
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - started)
                          .count();

    if (!result.launched)
    {
        Logger::error("ffmpeg could not be started: " + result.error_output);
        throw TranscodeError("ffmpeg could not be started", result.error_output);
    }
    if (result.timed_out)
    {
        Logger::error("ffmpeg timed out after " + std::to_string(timeout_.count()) + "s");
        throw TranscodeError("ffmpeg timed out after " + std::to_string(timeout_.count()) + " seconds",
                             result.error_output);
    }
    if (result.exit_status != 0)
    {
        Logger::error("ffmpeg failed with status " + std::to_string(result.exit_status) + ": " +
                      result.error_output);
        throw TranscodeError("ffmpeg failed", result.error_output, result.exit_status);
    }
    if (!isNonEmptyFile(output_path))
    {
        Logger::error("ffmpeg exited cleanly but produced no output at " + output_path);
        throw TranscodeError("ffmpeg produced no output", result.error_output, result.exit_status);
    }

    Logger::info("ffmpeg finished in " + std::to_string(elapsed_ms) + " ms: " + output_path);
    return output_path;
}

bool TranscodeEngine::isAvailable() const
{
    ProcessResult result = runner_->run({ffmpeg_path_, "-version"}, std::chrono::seconds(10));
    return result.success();
}
