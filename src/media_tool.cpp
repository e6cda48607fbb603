#include "core/media_tool.hpp"
#include "core/media_error.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <sys/wait.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    // Keep error messages bounded; ffmpeg prints its whole banner before the failure
    const size_t MAX_ERROR_OUTPUT = 2000;

    std::string trimOutput(const std::string &text)
    {
        const auto begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
            return "";
        const auto end = text.find_last_not_of(" \t\r\n");
        std::string trimmed = text.substr(begin, end - begin + 1);
        if (trimmed.size() > MAX_ERROR_OUTPUT)
            trimmed = trimmed.substr(trimmed.size() - MAX_ERROR_OUTPUT);
        return trimmed;
    }
}

FfmpegMediaTool::FfmpegMediaTool(std::string ffmpeg, std::string ffprobe)
    : ffmpeg_(std::move(ffmpeg)), ffprobe_(std::move(ffprobe))
{
}

std::string FfmpegMediaTool::shellQuote(const std::string &arg)
{
    std::string quoted = "'";
    for (char c : arg)
    {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    quoted += "'";
    return quoted;
}

CommandResult FfmpegMediaTool::runCommand(const std::vector<std::string> &args, bool merge_stderr)
{
    CommandResult result;
    std::string command;
    for (const auto &arg : args)
    {
        if (!command.empty())
            command += " ";
        command += shellQuote(arg);
    }
    command += merge_stderr ? " 2>&1" : " 2>/dev/null";

    Logger::debug("Running command: " + command);
    FILE *pipe = popen(command.c_str(), "r");
    if (!pipe)
    {
        result.error_message = "Failed to start command: " + args.front();
        return result;
    }

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr)
    {
        result.output += buffer;
    }

    int status = pclose(pipe);
    if (status == -1)
    {
        result.error_message = "Failed to wait for command: " + args.front();
        return result;
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    result.success = result.exit_code == 0;
    if (!result.success)
    {
        result.error_message = trimOutput(result.output);
        if (result.error_message.empty())
            result.error_message = args.front() + " exited with code " + std::to_string(result.exit_code);
    }
    return result;
}

void FfmpegMediaTool::requireSuccess(const CommandResult &result, const std::string &what)
{
    if (!result.success)
    {
        throw MediaError(MediaErrorKind::TRANSCODE_FAILURE, what + ": " + result.error_message);
    }
}

std::vector<std::string> FfmpegMediaTool::buildProbeCommand(const fs::path &path) const
{
    return {ffprobe_, "-v", "error", "-select_streams", "v:0",
            "-show_entries", "stream=width,height,avg_frame_rate",
            "-show_entries", "format=duration",
            "-of", "json", path.string()};
}

double FfmpegMediaTool::parseFps(const std::string &value)
{
    if (value.empty() || value == "0/0")
        return 0.0;
    try
    {
        auto slash = value.find('/');
        if (slash == std::string::npos)
            return std::stod(value);
        double numerator = std::stod(value.substr(0, slash));
        double denominator = std::stod(value.substr(slash + 1));
        if (denominator == 0.0)
            return 0.0;
        return numerator / denominator;
    }
    catch (const std::exception &)
    {
        return 0.0;
    }
}

VideoMetadata FfmpegMediaTool::parseProbeOutput(const std::string &output)
{
    json data = json::parse(output, nullptr, false);
    if (data.is_discarded() || !data.is_object())
    {
        throw MediaError(MediaErrorKind::TRANSCODE_FAILURE, "ffprobe returned invalid JSON");
    }

    VideoMetadata metadata;
    if (data.contains("format") && data["format"].is_object())
    {
        const auto &duration = data["format"].value("duration", json());
        if (duration.is_string())
            metadata.duration = parseFps(duration.get<std::string>());
        else if (duration.is_number())
            metadata.duration = duration.get<double>();
    }
    if (data.contains("streams") && data["streams"].is_array() && !data["streams"].empty())
    {
        const auto &stream = data["streams"][0];
        if (stream.contains("width") && stream["width"].is_number_integer())
            metadata.width = stream["width"].get<int>();
        if (stream.contains("height") && stream["height"].is_number_integer())
            metadata.height = stream["height"].get<int>();
        if (stream.contains("avg_frame_rate") && stream["avg_frame_rate"].is_string())
            metadata.fps = parseFps(stream["avg_frame_rate"].get<std::string>());
    }
    return metadata;
}

VideoMetadata FfmpegMediaTool::probe(const fs::path &path)
{
    CommandResult result = runCommand(buildProbeCommand(path), false);
    requireSuccess(result, "ffprobe failed for " + path.string());
    return parseProbeOutput(result.output);
}

std::vector<std::string> FfmpegMediaTool::buildSegmentCommand(const fs::path &input, const fs::path &output_pattern,
                                                              int segment_time, bool use_hwaccel) const
{
    const std::string seconds = std::to_string(segment_time);
    std::vector<std::string> command = {ffmpeg_, "-y"};
    if (use_hwaccel)
    {
        command.insert(command.end(), {"-hwaccel", "cuda", "-i", input.string(),
                                       "-c:v", "h264_nvenc", "-preset", "p4", "-rc", "vbr", "-cq", "19",
                                       "-b:v", "10M", "-maxrate", "20M", "-bufsize", "20M"});
    }
    else
    {
        command.insert(command.end(), {"-i", input.string(), "-c:v", "libx264", "-crf", "22", "-preset", "veryfast"});
    }
    command.insert(command.end(), {"-pix_fmt", "yuv420p",
                                   "-force_key_frames", "expr:gte(t,n_forced*" + seconds + ")",
                                   "-c:a", "aac", "-b:a", "128k",
                                   "-f", "segment", "-segment_time", seconds, "-reset_timestamps", "1",
                                   output_pattern.string()});
    return command;
}

std::vector<ClipInfo> FfmpegMediaTool::splitVideo(const fs::path &source, const fs::path &output_dir, int min_clip,
                                                  int max_clip, bool use_hwaccel)
{
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec)
    {
        throw MediaError(MediaErrorKind::TRANSCODE_FAILURE,
                         "Cannot create clip directory " + output_dir.string() + ": " + ec.message());
    }

    CommandResult result = runCommand(buildSegmentCommand(source, output_dir / "clip_%04d.mp4", max_clip, use_hwaccel));
    requireSuccess(result, "ffmpeg segment failed for " + source.string());

    std::vector<fs::path> clip_paths;
    for (const auto &entry : fs::directory_iterator(output_dir))
    {
        const std::string name = entry.path().filename().string();
        if (entry.is_regular_file() && name.rfind("clip_", 0) == 0 && entry.path().extension() == ".mp4")
            clip_paths.push_back(entry.path());
    }
    std::sort(clip_paths.begin(), clip_paths.end());

    std::vector<ClipInfo> clips;
    double start = 0.0;
    for (const auto &clip_path : clip_paths)
    {
        VideoMetadata metadata = probe(clip_path);
        const double clip_start = start;
        start += metadata.duration;
        if (metadata.duration < min_clip)
        {
            Logger::debug("Dropping short clip " + clip_path.string());
            continue;
        }

        ClipInfo clip;
        clip.source_path = source.string();
        clip.clip_path = clip_path.string();
        clip.start = clip_start;
        clip.end = clip_start + metadata.duration;
        clip.duration = metadata.duration;
        clip.width = metadata.width;
        clip.height = metadata.height;
        clip.fps = metadata.fps;
        clips.push_back(clip);
    }
    return clips;
}

std::vector<std::string> FfmpegMediaTool::buildFrameCommand(const fs::path &clip_path, const fs::path &output_path,
                                                            double timestamp) const
{
    std::ostringstream ts;
    ts << std::fixed << std::setprecision(3) << timestamp;
    return {ffmpeg_, "-y", "-ss", ts.str(), "-i", clip_path.string(), "-frames:v", "1", "-q:v", "2",
            output_path.string()};
}

void FfmpegMediaTool::extractRepresentativeFrame(const fs::path &clip_path, const fs::path &output_path)
{
    VideoMetadata metadata = probe(clip_path);
    const double timestamp = std::max(0.0, metadata.duration / 2.0);

    std::error_code ec;
    if (!output_path.parent_path().empty())
        fs::create_directories(output_path.parent_path(), ec);
    if (ec)
    {
        throw MediaError(MediaErrorKind::TRANSCODE_FAILURE,
                         "Cannot create frame directory " + output_path.parent_path().string() + ": " + ec.message());
    }

    CommandResult result = runCommand(buildFrameCommand(clip_path, output_path, timestamp));
    requireSuccess(result, "ffmpeg frame extract failed for " + clip_path.string());
}

std::vector<std::string> FfmpegMediaTool::buildConcatCommand(const fs::path &list_path, const fs::path &output_path,
                                                             bool use_hwaccel) const
{
    std::vector<std::string> command = {ffmpeg_, "-y", "-f", "concat", "-safe", "0", "-i", list_path.string()};
    if (use_hwaccel)
    {
        command.insert(command.end(), {"-c:v", "h264_nvenc", "-preset", "p4", "-rc", "vbr", "-cq", "19",
                                       "-b:v", "10M", "-maxrate", "20M", "-bufsize", "20M"});
    }
    else
    {
        command.insert(command.end(), {"-c:v", "libx264"});
    }
    command.insert(command.end(), {"-pix_fmt", "yuv420p", "-profile:v", "high",
                                   "-c:a", "aac", "-b:a", "128k",
                                   "-movflags", "+faststart", output_path.string()});
    return command;
}

bool FfmpegMediaTool::writeConcatList(const std::vector<fs::path> &clips, const fs::path &list_path)
{
    std::error_code ec;
    if (!list_path.parent_path().empty())
        fs::create_directories(list_path.parent_path(), ec);
    if (ec)
        return false;

    std::ofstream list(list_path, std::ios::trunc);
    if (!list)
        return false;
    for (size_t i = 0; i < clips.size(); ++i)
    {
        // Concat demuxer quoting: a single quote is written as '\''
        std::string escaped;
        for (char c : clips[i].generic_string())
        {
            if (c == '\'')
                escaped += "'\\''";
            else
                escaped += c;
        }
        list << "file '" << escaped << "'";
        if (i + 1 < clips.size())
            list << "\n";
    }
    return static_cast<bool>(list);
}

void FfmpegMediaTool::concatClips(const std::vector<fs::path> &clips, const fs::path &output_path, bool use_hwaccel,
                                  const fs::path &list_path)
{
    if (clips.empty())
    {
        throw MediaError(MediaErrorKind::TRANSCODE_FAILURE, "No clips to concatenate for " + output_path.string());
    }
    if (!writeConcatList(clips, list_path))
    {
        throw MediaError(MediaErrorKind::TRANSCODE_FAILURE, "Cannot write concat list " + list_path.string());
    }

    std::error_code ec;
    if (!output_path.parent_path().empty())
        fs::create_directories(output_path.parent_path(), ec);
    if (ec)
    {
        throw MediaError(MediaErrorKind::TRANSCODE_FAILURE,
                         "Cannot create output directory " + output_path.parent_path().string() + ": " + ec.message());
    }

    CommandResult result = runCommand(buildConcatCommand(list_path, output_path, use_hwaccel));
    requireSuccess(result, "ffmpeg concat failed for " + output_path.string());
}

bool FfmpegMediaTool::isAvailable() const
{
    CommandResult result = runCommand({ffmpeg_, "-hide_banner", "-version"});
    return result.success;
}

bool FfmpegMediaTool::hasNvenc() const
{
    CommandResult result = runCommand({ffmpeg_, "-hide_banner", "-encoders"});
    return result.success && result.output.find("h264_nvenc") != std::string::npos;
}
