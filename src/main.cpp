#include "core/config_loader.hpp"
#include "core/execution_planner.hpp"
#include "core/judge_client.hpp"
#include "core/media_error.hpp"
#include "core/media_tool.hpp"
#include "core/photo_pipeline.hpp"
#include "core/video_digest.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Reel Curator - photo and video highlight selection" << std::endl;
        std::cout << "Usage: " << program << " photo|video [options]" << std::endl;
        std::cout << "Common options:" << std::endl;
        std::cout << "  --input PATH                  Input directory (video: file or directory)" << std::endl;
        std::cout << "  --output DIR                  Output directory" << std::endl;
        std::cout << "  --config FILE                 YAML config; command line values win" << std::endl;
        std::cout << "  --model NAME                  Judge model (default: $OLLAMA_MODEL)" << std::endl;
        std::cout << "  --ollama-base-url URL         Judge URL (default: $OLLAMA_BASE_URL or http://localhost:11434)" << std::endl;
        std::cout << "  --dry-run                     Print the execution plan and exit" << std::endl;
        std::cout << "  --log-format json|text        Event log format (default: text)" << std::endl;
        std::cout << "  --log-level LEVEL             TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "Photo options:" << std::endl;
        std::cout << "  --target-count N              Number of photos to select" << std::endl;
        std::cout << "  --resume                      Reuse cached scores for unchanged files" << std::endl;
        std::cout << "  --force                       Recompute scores even if cached" << std::endl;
        std::cout << "  --no-dedupe                   Disable near-duplicate removal" << std::endl;
        std::cout << "  --hamming-threshold N         Near-duplicate distance (default: 8)" << std::endl;
        std::cout << "Video options:" << std::endl;
        std::cout << "  --max-source-seconds N        Digest seconds per source" << std::endl;
        std::cout << "  --min-clip N                  Shortest clip kept (default: 2)" << std::endl;
        std::cout << "  --max-clip N                  Segment length (default: 6)" << std::endl;
        std::cout << "  --preset NAME                 youtube16x9, shorts9x16 or clips_only" << std::endl;
        std::cout << "  --use-hwaccel                 Encode with NVENC" << std::endl;
        std::cout << "  --keep-temp                   Keep temp/ after the batch" << std::endl;
        std::cout << "  --delete-split-files          With --keep-temp, still remove split clips" << std::endl;
        std::cout << "  --concat-in-digest-folder     Also write digest_clips/<stem>/digest.mp4" << std::endl;
        std::cout << "  --video-dedupe true|false     Near-duplicate clip removal (default: true)" << std::endl;
        std::cout << "  --video-dedupe-hamming-threshold N   (default: 6)" << std::endl;
        std::cout << "  --video-dedupe-scope per_source_video|global" << std::endl;
        std::cout << "  --video-max-selected-clips N  0 for unlimited (default: 20)" << std::endl;
        std::cout << "  --video-target-digest-seconds N      0 disables the target (default: 90)" << std::endl;
    }

    struct CommonArgs
    {
        std::string log_format = "text";
        std::string log_level = "INFO";
    };

    std::string requireValue(int argc, char *argv[], int &i)
    {
        if (i + 1 >= argc)
        {
            throw ConfigError(std::string("Missing value for ") + argv[i]);
        }
        return argv[++i];
    }

    int parseInt(const std::string &name, const std::string &value)
    {
        try
        {
            size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed == value.size())
                return parsed;
        }
        catch (const std::exception &)
        {
            throw ConfigError("Invalid integer for " + name + ": " + value);
        }
        throw ConfigError("Invalid integer for " + name + ": " + value);
    }

    double parseDouble(const std::string &name, const std::string &value)
    {
        try
        {
            size_t consumed = 0;
            double parsed = std::stod(value, &consumed);
            if (consumed == value.size())
                return parsed;
        }
        catch (const std::exception &)
        {
            throw ConfigError("Invalid number for " + name + ": " + value);
        }
        throw ConfigError("Invalid number for " + name + ": " + value);
    }

    bool parseCommon(const std::string &arg, int argc, char *argv[], int &i, CommonArgs &common,
                     std::optional<std::string> &config_path, std::optional<std::string> &input,
                     std::optional<std::string> &output, std::optional<std::string> &model,
                     std::optional<std::string> &base_url, bool &dry_run)
    {
        if (arg == "--config")
            config_path = requireValue(argc, argv, i);
        else if (arg == "--input")
            input = requireValue(argc, argv, i);
        else if (arg == "--output")
            output = requireValue(argc, argv, i);
        else if (arg == "--model")
            model = requireValue(argc, argv, i);
        else if (arg == "--ollama-base-url")
            base_url = requireValue(argc, argv, i);
        else if (arg == "--dry-run")
            dry_run = true;
        else if (arg == "--log-format")
            common.log_format = requireValue(argc, argv, i);
        else if (arg == "--log-level")
            common.log_level = requireValue(argc, argv, i);
        else
            return false;
        return true;
    }

    PhotoOptions parsePhotoArgs(int argc, char *argv[], CommonArgs &common)
    {
        PhotoOptions options;
        for (int i = 2; i < argc; i++)
        {
            std::string arg = argv[i];
            if (parseCommon(arg, argc, argv, i, common, options.config_path, options.input, options.output,
                            options.model, options.base_url, options.dry_run))
                continue;
            if (arg == "--target-count")
                options.target_count = parseInt(arg, requireValue(argc, argv, i));
            else if (arg == "--resume")
                options.resume = true;
            else if (arg == "--force")
                options.force = true;
            else if (arg == "--no-dedupe")
                options.dedupe = false;
            else if (arg == "--hamming-threshold")
                options.hamming_threshold = parseInt(arg, requireValue(argc, argv, i));
            else
                throw ConfigError("Unknown option: " + arg);
        }
        return options;
    }

    VideoOptions parseVideoArgs(int argc, char *argv[], CommonArgs &common)
    {
        VideoOptions options;
        for (int i = 2; i < argc; i++)
        {
            std::string arg = argv[i];
            if (parseCommon(arg, argc, argv, i, common, options.config_path, options.input, options.output,
                            options.model, options.base_url, options.dry_run))
                continue;
            if (arg == "--max-source-seconds")
                options.max_source_seconds = parseDouble(arg, requireValue(argc, argv, i));
            else if (arg == "--min-clip")
                options.min_clip = parseInt(arg, requireValue(argc, argv, i));
            else if (arg == "--max-clip")
                options.max_clip = parseInt(arg, requireValue(argc, argv, i));
            else if (arg == "--preset")
                options.preset = requireValue(argc, argv, i);
            else if (arg == "--use-hwaccel")
                options.use_hwaccel = true;
            else if (arg == "--keep-temp")
                options.keep_temp = true;
            else if (arg == "--delete-split-files")
                options.delete_split_files = true;
            else if (arg == "--concat-in-digest-folder")
                options.concat_in_digest_folder = true;
            else if (arg == "--video-dedupe")
            {
                std::string value = requireValue(argc, argv, i);
                options.video_dedupe = ConfigLoader::coerceBool(value);
                if (!options.video_dedupe)
                    throw ConfigError("Invalid boolean for --video-dedupe: " + value);
            }
            else if (arg == "--video-dedupe-hamming-threshold")
                options.video_dedupe_hamming_threshold = parseInt(arg, requireValue(argc, argv, i));
            else if (arg == "--video-dedupe-scope")
                options.video_dedupe_scope = requireValue(argc, argv, i);
            else if (arg == "--video-max-selected-clips")
                options.video_max_selected_clips = parseInt(arg, requireValue(argc, argv, i));
            else if (arg == "--video-target-digest-seconds")
                options.video_target_digest_seconds = parseDouble(arg, requireValue(argc, argv, i));
            else
                throw ConfigError("Unknown option: " + arg);
        }
        return options;
    }

    std::unique_ptr<JudgeClient> makeJudge(const std::string &base_url)
    {
        auto transport = std::make_shared<HttpJudgeTransport>(base_url);
        return std::make_unique<JudgeClient>(transport, JudgeClient::Settings{});
    }

    int runPhoto(int argc, char *argv[])
    {
        CommonArgs common;
        PhotoOptions options = parsePhotoArgs(argc, argv, common);
        Logger::init(common.log_level);
        Logger::setFormat(common.log_format);

        PhotoSettings settings = ConfigLoader::resolvePhoto(options);
        if (settings.dry_run)
        {
            ExecutionPlan plan = ExecutionPlanner::photoPlan(settings.input_dir, settings.output_dir, settings.resume,
                                                             settings.force);
            std::cout << plan.toJson().dump(2, ' ', true) << std::endl;
            return 0;
        }

        auto judge = makeJudge(settings.base_url);
        if (!judge->ping())
        {
            Logger::error("Cannot reach the judge server. Check OLLAMA_BASE_URL or --ollama-base-url.");
            return 1;
        }

        PhotoPipeline pipeline(settings, *judge);
        PhotoBatchResult result = pipeline.run();
        return result.manifest_written ? 0 : 1;
    }

    int runVideo(int argc, char *argv[])
    {
        CommonArgs common;
        VideoOptions options = parseVideoArgs(argc, argv, common);
        Logger::init(common.log_level);
        Logger::setFormat(common.log_format);

        VideoSettings settings = ConfigLoader::resolveVideo(options);
        if (settings.dry_run)
        {
            ExecutionPlan plan = ExecutionPlanner::videoPlan(settings.input, settings.output_dir, settings.preset,
                                                             settings.concat_in_digest_folder);
            std::cout << plan.toJson().dump(2, ' ', true) << std::endl;
            return 0;
        }

        FfmpegMediaTool media_tool;
        if (!media_tool.isAvailable())
        {
            Logger::error("ffmpeg not found in PATH.");
            return 1;
        }
        if (settings.use_hwaccel && !media_tool.hasNvenc())
        {
            Logger::error("NVENC encoder not available in ffmpeg.");
            return 1;
        }

        auto judge = makeJudge(settings.base_url);
        if (!judge->ping())
        {
            Logger::error("Cannot reach the judge server. Check OLLAMA_BASE_URL or --ollama-base-url.");
            return 1;
        }

        VideoDigest digest(settings, media_tool, *judge);
        VideoBatchResult result = digest.run();
        return result.manifest_written ? 0 : 1;
    }
}

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        printUsage(argv[0]);
        return 2;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h")
    {
        printUsage(argv[0]);
        return 0;
    }

    try
    {
        if (command == "photo")
            return runPhoto(argc, argv);
        if (command == "video")
            return runVideo(argc, argv);

        std::cout << "Error: unknown command '" << command << "'" << std::endl;
        printUsage(argv[0]);
        return 2;
    }
    catch (const ConfigError &e)
    {
        Logger::error(std::string("Configuration error: ") + e.what());
        return 2;
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
