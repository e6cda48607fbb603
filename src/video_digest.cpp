#include "core/video_digest.hpp"
#include "core/file_utils.hpp"
#include "core/fingerprint.hpp"
#include "core/image_payload.hpp"
#include "core/manifest.hpp"
#include "core/media_error.hpp"
#include "core/prompt_builder.hpp"
#include "core/quality_analyzer.hpp"
#include "core/score_normalizer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>

using json = nlohmann::json;

namespace
{
    std::string digestClipName(size_t index, const std::string &extension)
    {
        std::ostringstream name;
        name << "clip_" << std::setw(4) << std::setfill('0') << index << extension;
        return name.str();
    }

    json optionalJson(const std::optional<std::string> &value)
    {
        return value ? json(*value) : json(nullptr);
    }
}

json SourceResult::toJson() const
{
    json clips = json::array();
    for (const auto &clip : selected_clips)
    {
        clips.push_back({{"path", clip.path},
                         {"original_clip_path", clip.original_clip_path},
                         {"start", clip.start},
                         {"end", clip.end},
                         {"duration", clip.duration},
                         {"score", clip.score ? json(*clip.score) : json(nullptr)}});
    }
    return json{
        {"source_video", source_video},
        {"clip_count", clip_count},
        {"selected_clips", clips},
        {"digest_path", optionalJson(digest_path)},
        {"folder_digest_path", optionalJson(folder_digest_path)},
        {"total_duration", total_duration},
        {"stats", stats.toJson()},
        {"error", optionalJson(error)}};
}

VideoDigest::VideoDigest(VideoSettings settings, MediaTool &media_tool, JudgeClient &judge,
                         TempCleanup::SleepFunction cleanup_sleep)
    : settings_(std::move(settings)), media_tool_(media_tool), judge_(judge), cleanup_(std::move(cleanup_sleep)),
      paths_(OutputPaths::video(settings_.output_dir))
{
}

std::string VideoDigest::sourceLabel(const std::string &source_path) const
{
    auto it = source_labels_.find(source_path);
    if (it != source_labels_.end())
        return it->second;
    return fs::path(source_path).stem().string();
}

std::vector<ClipInfo> VideoDigest::splitSource(const fs::path &source, std::optional<std::string> &error)
{
    const fs::path clip_dir = OutputPaths::splitClipsDir(paths_) / sourceLabel(source.string());
    try
    {
        std::vector<ClipInfo> clips = media_tool_.splitVideo(source, clip_dir, settings_.min_clip, settings_.max_clip,
                                                             settings_.use_hwaccel);
        ledger_.recordOk(JobStep::SPLIT, source.string());
        Logger::event(Logger::Level::INFO, "source_split", "Split source into " + std::to_string(clips.size()) + " clips",
                      source.string());
        return clips;
    }
    catch (const std::exception &e)
    {
        error = e.what();
        ledger_.recordFailed(JobStep::SPLIT, source.string(), e.what());
        Logger::event(Logger::Level::ERROR, "source_failed", e.what(), source.string());
        return {};
    }
}

ClipRecord VideoDigest::scoreClip(const ClipInfo &clip)
{
    ClipRecord record;
    record.clip = clip;
    const fs::path clip_path(clip.clip_path);
    const fs::path frame_path = OutputPaths::framesDir(paths_) / sourceLabel(clip.source_path) /
                                (clip_path.stem().string() + ".jpg");

    try
    {
        media_tool_.extractRepresentativeFrame(clip_path, frame_path);
        record.frame_path = frame_path.string();

        cv::Mat frame;
        try
        {
            frame = cv::imread(record.frame_path, cv::IMREAD_COLOR);
        }
        catch (const cv::Exception &e)
        {
            throw MediaError(MediaErrorKind::DECODE_FAILURE, e.what());
        }
        if (frame.empty())
        {
            throw MediaError(MediaErrorKind::DECODE_FAILURE, "Cannot decode frame: " + record.frame_path);
        }
        record.frame_width = frame.cols;
        record.frame_height = frame.rows;
        record.frame_orientation = computeOrientation(frame.cols, frame.rows);
        record.fingerprint = Fingerprint::compute(frame);
        record.quality = QualityAnalyzer::analyze(frame);

        const std::string image_b64 = ImagePayload::encodeFileBase64(record.frame_path);
        const std::string prompt = PromptBuilder::build(PromptBuilder::Subject::CLIP_FRAME, *record.quality);
        JudgeAnalysis analysis = ScoreNormalizer::normalize(judge_.chat(settings_.model, image_b64, prompt));
        const double final_score = ScoreNormalizer::finalScore(analysis, *record.quality, record.frame_width,
                                                               record.frame_height);
        analysis.score = final_score;
        record.analysis = analysis;
        record.score_final = final_score;
        ledger_.recordOk(JobStep::SCORE, clip.clip_path);
    }
    catch (const std::exception &e)
    {
        record.analysis.reset();
        record.score_final.reset();
        record.error = e.what();
        ledger_.recordFailed(JobStep::SCORE, clip.clip_path, e.what());
        Logger::event(Logger::Level::ERROR, "clip_failed", e.what(), clip.clip_path);
    }
    return record;
}

SourceResult VideoDigest::processSource(const std::string &source_path, const std::vector<ClipRecord> &records,
                                        FingerprintAccumulator &accepted)
{
    SourceResult result;
    result.source_video = source_path;
    result.clip_count = records.size();

    const std::string stem = sourceLabel(source_path);
    JobStep step = JobStep::SELECT;
    try
    {
        ClipSelection selection = ClipSelector::selectClipsForSource(records, settings_.selection, accepted);
        result.stats = selection.stats;
        result.total_duration = selection.stats.total_selected_seconds;
        ledger_.recordOk(JobStep::SELECT, source_path);

        std::vector<ClipRecord> ordered = selection.selected;
        std::stable_sort(ordered.begin(), ordered.end(), [](const ClipRecord &a, const ClipRecord &b)
                         { return a.clip.start < b.clip.start; });

        step = JobStep::CONCAT;
        const fs::path selected_dir = OutputPaths::digestClipsSourceDir(paths_, stem);
        std::vector<fs::path> copied;
        for (size_t i = 0; i < ordered.size(); ++i)
        {
            const fs::path original(ordered[i].clip.clip_path);
            const fs::path destination = selected_dir / digestClipName(i + 1, original.extension().string());
            std::string copy_error;
            if (!FileUtils::copyFile(original, destination, copy_error))
            {
                throw std::runtime_error(copy_error);
            }
            copied.push_back(destination);

            DigestClip clip;
            clip.path = destination.string();
            clip.original_clip_path = original.string();
            clip.start = ordered[i].clip.start;
            clip.end = ordered[i].clip.end;
            clip.duration = ordered[i].clip.duration;
            clip.score = ordered[i].score_final;
            result.selected_clips.push_back(clip);
        }

        if (settings_.preset != "clips_only" && !copied.empty())
        {
            const fs::path digest = OutputPaths::finalDigestPath(paths_, stem);
            media_tool_.concatClips(copied, digest, settings_.use_hwaccel,
                                    OutputPaths::concatListPath(paths_, stem + "_root"));
            result.digest_path = digest.string();
        }
        if (settings_.concat_in_digest_folder && !copied.empty())
        {
            const fs::path folder_digest = selected_dir / "digest.mp4";
            media_tool_.concatClips(copied, folder_digest, settings_.use_hwaccel,
                                    OutputPaths::concatListPath(paths_, stem + "_folder"));
            result.folder_digest_path = folder_digest.string();
        }
        ledger_.recordOk(JobStep::CONCAT, source_path);
        Logger::event(Logger::Level::INFO, "source_digested",
                      "Selected " + std::to_string(result.selected_clips.size()) + " clips", source_path,
                      {{"selected", result.selected_clips.size()}, {"total_seconds", result.total_duration}});
    }
    catch (const std::exception &e)
    {
        result.error = e.what();
        ledger_.recordFailed(step, source_path, e.what());
        Logger::event(Logger::Level::ERROR, "source_failed", e.what(), source_path);
    }
    return result;
}

json VideoDigest::buildManifest(const VideoBatchResult &result) const
{
    json sources = json::array();
    for (const auto &source : result.sources)
        sources.push_back(source.toJson());

    json clips = json::array();
    for (const auto &clip : result.clips)
        clips.push_back(clipRecordToJson(clip));

    const ClipSelectionOptions &selection = settings_.selection;
    return json{
        {"input", settings_.input},
        {"max_source_seconds", settings_.max_source_seconds},
        {"min_clip", settings_.min_clip},
        {"max_clip", settings_.max_clip},
        {"model", settings_.model},
        {"preset", settings_.preset},
        {"settings",
         {{"use_hwaccel", settings_.use_hwaccel},
          {"keep_temp", settings_.keep_temp},
          {"delete_split_files", settings_.delete_split_files},
          {"concat_in_digest_folder", settings_.concat_in_digest_folder},
          {"video_dedupe", selection.dedupe_enabled},
          {"video_dedupe_hamming_threshold", selection.hamming_threshold},
          {"video_dedupe_scope", dedupeScopeName(selection.scope)},
          {"video_max_selected_clips", selection.max_selected_clips},
          {"video_target_digest_seconds", selection.target_digest_seconds}}},
        {"sources", sources},
        {"clips", clips},
        {"job_state", ledger_.toJson()},
        {"cleanup", result.cleanup.toJson()}};
}

VideoBatchResult VideoDigest::run()
{
    const auto started = std::chrono::steady_clock::now();
    VideoBatchResult result;

    std::error_code ec;
    fs::create_directories(paths_.scores_dir, ec);
    if (!ec)
        fs::create_directories(paths_.temp_dir, ec);
    if (ec)
    {
        throw ConfigError("Cannot create output directories under " + paths_.output_dir.string() + ": " + ec.message());
    }

    const std::vector<fs::path> sources = FileUtils::collectVideoPaths(settings_.input);
    Logger::event(Logger::Level::INFO, "batch_started", "Video batch started", settings_.input,
                  {{"total_files", sources.size()}});
    source_labels_ = OutputPaths::sourceLabels(sources);
    for (const auto &source : sources)
    {
        const std::string &label = source_labels_[source.string()];
        if (label != source.stem().string())
        {
            Logger::warn("Source stem '" + source.stem().string() + "' is shared by several inputs, writing " +
                         source.string() + " as '" + label + "'");
        }
    }

    std::vector<std::optional<std::string>> split_errors(sources.size());
    std::vector<std::vector<ClipInfo>> split_clips(sources.size());
    for (size_t i = 0; i < sources.size(); ++i)
        split_clips[i] = splitSource(sources[i], split_errors[i]);

    std::map<std::string, std::vector<ClipRecord>> records_by_source;
    for (const auto &clips : split_clips)
    {
        for (const auto &clip : clips)
        {
            ClipRecord record = scoreClip(clip);
            records_by_source[clip.source_path].push_back(record);
            result.clips.push_back(record);
        }
    }

    FingerprintAccumulator global_accepted;
    for (size_t i = 0; i < sources.size(); ++i)
    {
        const std::string source_path = sources[i].string();
        if (split_errors[i])
        {
            SourceResult failed;
            failed.source_video = source_path;
            failed.error = split_errors[i];
            result.sources.push_back(failed);
            continue;
        }

        if (settings_.selection.scope == DedupeScope::GLOBAL)
        {
            result.sources.push_back(processSource(source_path, records_by_source[source_path], global_accepted));
        }
        else
        {
            FingerprintAccumulator source_accepted;
            result.sources.push_back(processSource(source_path, records_by_source[source_path], source_accepted));
        }
    }

    std::vector<std::optional<std::string>> errors;
    for (const auto &source : result.sources)
        errors.push_back(source.error);
    for (const auto &clip : result.clips)
        errors.push_back(clip.error);

    CleanupRequest request;
    request.output_dir = paths_.output_dir;
    request.temp_dir = paths_.temp_dir;
    request.clip_dir = OutputPaths::splitClipsDir(paths_);
    request.keep_temp = settings_.keep_temp;
    request.delete_split_files = settings_.delete_split_files;
    result.cleanup = cleanup_.cleanupTempArtifacts(request, JobOutcome::compute(ledger_, errors));

    result.manifest_written = Manifest::save(paths_.manifest_path, buildManifest(result));
    if (!result.manifest_written)
    {
        Logger::error("Failed to write manifest: " + paths_.manifest_path.string());
    }

    size_t failed = 0;
    for (const auto &error : errors)
    {
        if (error)
            failed++;
    }
    const double duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    Logger::event(Logger::Level::INFO, "batch_finished", "Video batch finished", paths_.manifest_path.string(),
                  {{"total_files", sources.size()},
                   {"processed", result.clips.size()},
                   {"failed", failed},
                   {"duration_seconds", duration}});
    return result;
}
