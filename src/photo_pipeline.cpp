#include "core/photo_pipeline.hpp"
#include "core/file_utils.hpp"
#include "core/fingerprint.hpp"
#include "core/image_payload.hpp"
#include "core/manifest.hpp"
#include "core/media_error.hpp"
#include "core/photo_selector.hpp"
#include "core/prompt_builder.hpp"
#include "core/quality_analyzer.hpp"
#include "core/score_cache.hpp"
#include "core/score_normalizer.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <set>
#include <opencv2/imgcodecs.hpp>
#include <tbb/parallel_for.h>

using json = nlohmann::json;

PhotoPipeline::PhotoPipeline(PhotoSettings settings, JudgeClient &judge)
    : settings_(std::move(settings)), judge_(judge), paths_(OutputPaths::photo(settings_.output_dir))
{
}

std::vector<MediaItem> PhotoPipeline::analyzePixels(const std::vector<fs::path> &paths)
{
    std::vector<MediaItem> items(paths.size());
    tbb::parallel_for(size_t(0), paths.size(), [&](size_t i)
                      {
                          MediaItem &item = items[i];
                          item.path = paths[i].string();
                          try
                          {
                              cv::Mat image = cv::imread(item.path, cv::IMREAD_COLOR);
                              if (image.empty())
                              {
                                  throw MediaError(MediaErrorKind::DECODE_FAILURE, "Cannot decode image: " + item.path);
                              }
                              item.width = image.cols;
                              item.height = image.rows;
                              item.orientation = computeOrientation(item.width, item.height);
                              item.fingerprint = Fingerprint::compute(image);
                              item.quality = QualityAnalyzer::analyze(image);
                          }
                          catch (const cv::Exception &e)
                          {
                              item.error = MediaError(MediaErrorKind::DECODE_FAILURE, e.what()).what();
                          }
                          catch (const std::exception &e)
                          {
                              item.error = e.what();
                          } });
    return items;
}

bool PhotoPipeline::loadFromCache(MediaItem &item, ScoreCache &cache) const
{
    auto record = cache.get(item.path, Fingerprint::toHex(*item.fingerprint));
    if (!record)
        return false;

    JudgeAnalysis analysis;
    analysis.overall_score = record->score;
    if (record->analysis)
    {
        JudgeOutput parsed = ScoreNormalizer::parse(*record->analysis);
        if (const auto *valid = std::get_if<ValidJudgeOutput>(&parsed))
            analysis = valid->analysis;
    }
    analysis.score = record->score;

    if (record->quality)
    {
        if (auto quality = qualityFromJson(*record->quality))
            item.quality = quality;
    }
    item.analysis = analysis;
    item.final_score = record->score;
    item.from_cache = true;
    return true;
}

void PhotoPipeline::scoreWithJudge(MediaItem &item, ScoreCache &cache) const
{
    const std::string image_b64 = ImagePayload::encodeFileBase64(item.path);
    const std::string prompt = PromptBuilder::build(PromptBuilder::Subject::PHOTO, *item.quality);
    json raw = judge_.chat(settings_.model, image_b64, prompt);

    JudgeAnalysis analysis = ScoreNormalizer::normalize(raw);
    const double final_score = ScoreNormalizer::finalScore(analysis, *item.quality, item.width, item.height);
    analysis.score = final_score;

    item.analysis = analysis;
    item.final_score = final_score;

    DBOpResult stored = cache.upsert(item.path, Fingerprint::toHex(*item.fingerprint), final_score,
                                     analysisToJson(analysis), qualityToJson(*item.quality));
    if (!stored.success)
    {
        Logger::warn("Failed to store score for " + item.path + ": " + stored.error_message);
    }
}

size_t PhotoPipeline::copySelected(std::vector<MediaItem> &items) const
{
    size_t failures = 0;
    for (auto &item : items)
    {
        if (!item.selected)
            continue;
        std::string error;
        const fs::path destination = paths_.selected_dir / fs::path(item.path).filename();
        if (!FileUtils::copyFile(item.path, destination, error))
        {
            Logger::event(Logger::Level::ERROR, "copy_failed", "Failed to copy selected photo", item.path,
                          {{"error", error}});
            item.error = error;
            item.selected = false;
            failures++;
        }
    }
    return failures;
}

json PhotoPipeline::buildManifest(const std::vector<MediaItem> &items) const
{
    json photos = json::array();
    for (const auto &item : items)
        photos.push_back(mediaItemToJson(item));

    return json{
        {"input", settings_.input_dir},
        {"model", settings_.model},
        {"target_count", settings_.target_count},
        {"resume", settings_.resume && !settings_.force},
        {"dedupe", settings_.dedupe_enabled},
        {"hamming_threshold", settings_.hamming_threshold},
        {"photos", photos}};
}

PhotoBatchResult PhotoPipeline::run()
{
    const auto started = std::chrono::steady_clock::now();
    PhotoBatchResult result;

    std::error_code ec;
    fs::create_directories(paths_.selected_dir, ec);
    if (!ec)
        fs::create_directories(paths_.scores_dir, ec);
    if (ec)
    {
        throw ConfigError("Cannot create output directories under " + paths_.output_dir.string() + ": " + ec.message());
    }

    const std::vector<fs::path> image_paths = FileUtils::collectImagePaths(settings_.input_dir);
    Logger::event(Logger::Level::INFO, "batch_started", "Photo batch started", settings_.input_dir,
                  {{"total_files", image_paths.size()}});

    ScoreCache cache(paths_.db_path.string());
    const bool resume_enabled = settings_.resume && !settings_.force;
    if (resume_enabled && !cache.isValid())
    {
        Logger::warn("Resume cache unavailable, scoring every photo: " + paths_.db_path.string());
    }

    result.items = analyzePixels(image_paths);

    for (auto &item : result.items)
    {
        if (item.error)
        {
            result.failed++;
            Logger::event(Logger::Level::ERROR, "item_failed", *item.error, item.path);
            continue;
        }

        try
        {
            if (resume_enabled && loadFromCache(item, cache))
            {
                result.skipped++;
                Logger::event(Logger::Level::DEBUG, "item_skipped", "Using cached score", item.path);
                continue;
            }
            scoreWithJudge(item, cache);
            result.processed++;
            Logger::event(Logger::Level::DEBUG, "item_scored", "Scored photo", item.path,
                          {{"score_final", *item.final_score}});
        }
        catch (const std::exception &e)
        {
            item.analysis.reset();
            item.final_score.reset();
            item.error = e.what();
            result.failed++;
            Logger::event(Logger::Level::ERROR, "item_failed", e.what(), item.path);
        }
    }

    std::vector<MediaItem> chosen = PhotoSelector::selectTopPhotos(
        result.items, static_cast<size_t>(settings_.target_count), settings_.hamming_threshold,
        settings_.dedupe_enabled);
    std::set<std::string> chosen_paths;
    for (const auto &item : chosen)
        chosen_paths.insert(item.path);
    for (auto &item : result.items)
        item.selected = chosen_paths.count(item.path) > 0;

    result.failed += copySelected(result.items);
    for (const auto &item : result.items)
    {
        if (item.selected)
            result.selected++;
    }

    result.manifest_written = Manifest::save(paths_.manifest_path, buildManifest(result.items));
    if (!result.manifest_written)
    {
        Logger::error("Failed to write manifest: " + paths_.manifest_path.string());
    }

    const double duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    Logger::event(Logger::Level::INFO, "batch_finished", "Photo batch finished", paths_.manifest_path.string(),
                  {{"total_files", result.items.size()},
                   {"processed", result.processed},
                   {"skipped", result.skipped},
                   {"failed", result.failed},
                   {"selected", result.selected},
                   {"duration_seconds", duration}});
    return result;
}
