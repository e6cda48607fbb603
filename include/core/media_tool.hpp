#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/media_item.hpp"

namespace fs = std::filesystem;

struct VideoMetadata
{
    double duration = 0.0;
    int width = 0;
    int height = 0;
    double fps = 0.0;
};

/**
 * @brief Outcome of one external command
 */
struct CommandResult
{
    bool success = false;
    int exit_code = -1;
    std::string output;
    std::string error_message;
};

/**
 * @brief Transcoding collaborator used by the video pipeline
 */
class MediaTool
{
public:
    virtual ~MediaTool() = default;

    /**
     * @throws MediaError (TranscodeFailure)
     */
    virtual VideoMetadata probe(const fs::path &path) = 0;

    /**
     * @brief Cut a source into clip_NNNN.mp4 segments of max_clip seconds
     * @return Kept clips in file order; segments shorter than min_clip are dropped
     * @throws MediaError (TranscodeFailure)
     */
    virtual std::vector<ClipInfo> splitVideo(const fs::path &source, const fs::path &output_dir, int min_clip,
                                             int max_clip, bool use_hwaccel) = 0;

    /**
     * @brief Write the frame at the middle of a clip to output_path
     * @throws MediaError (TranscodeFailure)
     */
    virtual void extractRepresentativeFrame(const fs::path &clip_path, const fs::path &output_path) = 0;

    /**
     * @brief Concatenate clips in the given order, re-encoding to output_path
     * @throws MediaError (TranscodeFailure)
     */
    virtual void concatClips(const std::vector<fs::path> &clips, const fs::path &output_path, bool use_hwaccel,
                             const fs::path &list_path) = 0;
};

/**
 * @brief MediaTool that shells out to ffmpeg and ffprobe
 */
class FfmpegMediaTool : public MediaTool
{
public:
    explicit FfmpegMediaTool(std::string ffmpeg = "ffmpeg", std::string ffprobe = "ffprobe");

    VideoMetadata probe(const fs::path &path) override;
    std::vector<ClipInfo> splitVideo(const fs::path &source, const fs::path &output_dir, int min_clip, int max_clip,
                                     bool use_hwaccel) override;
    void extractRepresentativeFrame(const fs::path &clip_path, const fs::path &output_path) override;
    void concatClips(const std::vector<fs::path> &clips, const fs::path &output_path, bool use_hwaccel,
                     const fs::path &list_path) override;

    bool isAvailable() const;
    bool hasNvenc() const;

    std::vector<std::string> buildProbeCommand(const fs::path &path) const;
    std::vector<std::string> buildSegmentCommand(const fs::path &input, const fs::path &output_pattern,
                                                 int segment_time, bool use_hwaccel) const;
    std::vector<std::string> buildFrameCommand(const fs::path &clip_path, const fs::path &output_path,
                                               double timestamp) const;
    std::vector<std::string> buildConcatCommand(const fs::path &list_path, const fs::path &output_path,
                                                bool use_hwaccel) const;

    static VideoMetadata parseProbeOutput(const std::string &output);
    static double parseFps(const std::string &value);
    static std::string shellQuote(const std::string &arg);
    static bool writeConcatList(const std::vector<fs::path> &clips, const fs::path &list_path);

private:
    std::string ffmpeg_;
    std::string ffprobe_;

    static CommandResult runCommand(const std::vector<std::string> &args, bool merge_stderr = true);
    static void requireSuccess(const CommandResult &result, const std::string &what);
};
