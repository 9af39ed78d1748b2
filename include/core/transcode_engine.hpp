#pragma once

#include "core/process_runner.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Re-encodes a video into a smaller H.264/AAC file with ffmpeg
 *
 * The encoding profile is fixed: at most 1280x720 keeping the aspect ratio
 * and never upscaling, libx264 veryfast at CRF 28, AAC at 128 kbit/s.
 * Each call runs one ffmpeg process synchronously and returns only after
 * it has exited.
 */
class TranscodeEngine
{
public:
    static constexpr int MAX_WIDTH = 1280;
    static constexpr int MAX_HEIGHT = 720;
    static constexpr int CRF = 28;
    static constexpr const char *VIDEO_CODEC = "libx264";
    static constexpr const char *PRESET = "veryfast";
    static constexpr const char *AUDIO_CODEC = "aac";
    static constexpr const char *AUDIO_BITRATE = "128k";

    /**
     * @param runner Process runner used for every invocation
     * @param ffmpeg_path Program name or path of ffmpeg
     * @param timeout Kill ffmpeg after this long, zero for no limit
     */
    TranscodeEngine(std::shared_ptr<ProcessRunner> runner,
                    std::string ffmpeg_path = "ffmpeg",
                    std::chrono::seconds timeout = std::chrono::seconds(0));

    /**
     * @brief Transcode input_path into output_path
     * @return output_path, now a complete file owned by the caller
     * @throws TranscodeError on invalid input or a failed ffmpeg run. The
     *         caller must not use output_path afterwards.
     */
    std::string transcode(const std::string &input_path, const std::string &output_path) const;

    // Full ffmpeg argument vector, program name first
    std::vector<std::string> buildArguments(const std::string &input_path, const std::string &output_path) const;

    static std::string scaleFilter();

    // Probe "ffmpeg -version"
    bool isAvailable() const;

    const std::string &ffmpegPath() const { return ffmpeg_path_; }

private:
    std::shared_ptr<ProcessRunner> runner_;
    std::string ffmpeg_path_;
    std::chrono::seconds timeout_;
};
