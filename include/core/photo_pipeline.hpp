#pragma once

#include <string>
#include <vector>
#include "core/config_loader.hpp"
#include "core/judge_client.hpp"
#include "core/media_item.hpp"
#include "core/output_paths.hpp"

class ScoreCache;

/**
 * @brief Summary of a finished photo batch
 */
struct PhotoBatchResult
{
    std::vector<MediaItem> items; // Input order
    size_t processed = 0;
    size_t skipped = 0; // Served from the resume cache
    size_t failed = 0;
    size_t selected = 0;
    bool manifest_written = false;
};

/**
 * @brief Scores, selects and copies the photos of one input directory
 *
 * Decoding, fingerprinting and quality analysis run in parallel; judge calls and
 * cache writes run one item at a time. An item failure is stored on the item and
 * never stops the batch.
 */
class PhotoPipeline
{
public:
    PhotoPipeline(PhotoSettings settings, JudgeClient &judge);

    PhotoBatchResult run();

    /**
     * @brief Decode each path once and fill dimensions, fingerprint and quality
     */
    static std::vector<MediaItem> analyzePixels(const std::vector<fs::path> &paths);

private:
    PhotoSettings settings_;
    JudgeClient &judge_;
    PhotoOutputPaths paths_;

    bool loadFromCache(MediaItem &item, ScoreCache &cache) const;
    void scoreWithJudge(MediaItem &item, ScoreCache &cache) const;
    // Returns the number of copies that failed
    size_t copySelected(std::vector<MediaItem> &items) const;
    nlohmann::json buildManifest(const std::vector<MediaItem> &items) const;
};
