#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/clip_selector.hpp"
#include "core/config_loader.hpp"
#include "core/job_state.hpp"
#include "core/judge_client.hpp"
#include "core/media_item.hpp"
#include "core/media_tool.hpp"
#include "core/output_paths.hpp"
#include "core/temp_cleanup.hpp"

/**
 * @brief A clip copied into the digest folder
 */
struct DigestClip
{
    std::string path;
    std::string original_clip_path;
    double start = 0.0;
    double end = 0.0;
    double duration = 0.0;
    std::optional<double> score;
};

/**
 * @brief Outcome of selection and concatenation for one source video
 */
struct SourceResult
{
    std::string source_video;
    size_t clip_count = 0;
    std::vector<DigestClip> selected_clips; // Ordered by start time
    std::optional<std::string> digest_path;
    std::optional<std::string> folder_digest_path;
    double total_duration = 0.0;
    SelectionStats stats;
    std::optional<std::string> error;

    nlohmann::json toJson() const;
};

struct VideoBatchResult
{
    std::vector<SourceResult> sources;
    std::vector<ClipRecord> clips;
    CleanupReport cleanup;
    bool manifest_written = false;
};

/**
 * @brief Split, score, select and concatenate clips of one or more source videos
 *
 * Every step outcome goes to the job ledger keyed by source or clip path. A failed
 * source or clip is recorded and the batch continues; temp artifacts are only
 * removed when the whole batch is failure-free.
 */
class VideoDigest
{
public:
    VideoDigest(VideoSettings settings, MediaTool &media_tool, JudgeClient &judge,
                TempCleanup::SleepFunction cleanup_sleep = nullptr);

    VideoBatchResult run();

    /**
     * @brief Cut one source into clips under temp/clips/<label>
     * @return Clips, or nothing when splitting failed (recorded in the ledger)
     */
    std::vector<ClipInfo> splitSource(const fs::path &source, std::optional<std::string> &error);

    /**
     * @brief Extract, analyze and judge the middle frame of a clip
     */
    ClipRecord scoreClip(const ClipInfo &clip);

    /**
     * @brief Select clips for one source, copy them in start order and concatenate
     * @param accepted Fingerprint set for this source, or the batch-wide set
     */
    SourceResult processSource(const std::string &source_path, const std::vector<ClipRecord> &records,
                               FingerprintAccumulator &accepted);

    const JobState &jobState() const { return ledger_; }
    const VideoOutputPaths &paths() const { return paths_; }

private:
    VideoSettings settings_;
    MediaTool &media_tool_;
    JudgeClient &judge_;
    TempCleanup cleanup_;
    VideoOutputPaths paths_;
    JobState ledger_;
    std::map<std::string, std::string> source_labels_;

    std::string sourceLabel(const std::string &source_path) const;
    nlohmann::json buildManifest(const VideoBatchResult &result) const;
};
