#include <gtest/gtest.h>
#include <thread>
#include "core/clip_selector.hpp"

namespace
{
    ClipRecord clip(const std::string &path, double score, double duration, std::optional<uint64_t> fingerprint,
                    double brightness = 100.0, double start = 0.0)
    {
        ClipRecord record;
        record.clip.clip_path = path;
        record.clip.start = start;
        record.clip.duration = duration;
        record.clip.end = start + duration;
        record.score_final = score;
        record.fingerprint = fingerprint;
        QualityMetrics quality;
        quality.brightness = brightness;
        record.quality = quality;
        return record;
    }

    std::vector<std::string> clipPaths(const ClipSelection &selection)
    {
        std::vector<std::string> result;
        for (const auto &record : selection.selected)
            result.push_back(record.clip.clip_path);
        return result;
    }

    ClipSelectionOptions options(double max_source, double target, int max_clips, bool dedupe)
    {
        ClipSelectionOptions opts;
        opts.max_source_seconds = max_source;
        opts.target_digest_seconds = target;
        opts.max_selected_clips = max_clips;
        opts.dedupe_enabled = dedupe;
        opts.hamming_threshold = 6;
        return opts;
    }
}

TEST(ClipSelectorTest, DedupeKeepsBestScoringClip)
{
    std::vector<ClipRecord> records = {
        clip("a.mp4", 0.9, 5.0, 0xFFFFFFFFFFFFFFFFULL),
        clip("b.mp4", 0.8, 5.0, 0xFFFFFFFFFFFFFFFFULL)};

    FingerprintAccumulator accepted;
    ClipSelection selection = ClipSelector::selectClipsForSource(records, options(60, 90, 20, true), accepted);
    EXPECT_EQ(clipPaths(selection), (std::vector<std::string>{"a.mp4"}));
    EXPECT_EQ(selection.stats.removed_duplicates, 1u);
    EXPECT_EQ(accepted.size(), 1u);
}

TEST(ClipSelectorTest, DurationBudgetStopsAtDigestTarget)
{
    std::vector<ClipRecord> records = {
        clip("a.mp4", 0.9, 50.0, 0xFFFFFFFFFFFFFFFFULL),
        clip("b.mp4", 0.8, 50.0, 0x0F0F0F0F0F0F0F0FULL),
        clip("c.mp4", 0.7, 50.0, 0xF0F0F0F0F0F0F0F0ULL)};

    FingerprintAccumulator accepted;
    ClipSelection selection = ClipSelector::selectClipsForSource(records, options(300, 60, 2, false), accepted);
    EXPECT_EQ(clipPaths(selection), (std::vector<std::string>{"a.mp4"}));
    EXPECT_DOUBLE_EQ(selection.stats.total_selected_seconds, 50.0);
    EXPECT_EQ(selection.stats.selected_clips_count, 1u);
}

TEST(ClipSelectorTest, OversizedClipIsSkippedSoShorterOnesFit)
{
    std::vector<ClipRecord> records = {
        clip("short_best.mp4", 0.9, 6.0, std::nullopt),
        clip("long.mp4", 0.8, 10.0, std::nullopt),
        clip("short.mp4", 0.7, 4.0, std::nullopt)};

    FingerprintAccumulator accepted;
    ClipSelection selection = ClipSelector::selectClipsForSource(records, options(12, 0, 0, true), accepted);
    EXPECT_EQ(clipPaths(selection), (std::vector<std::string>{"short_best.mp4", "short.mp4"}));
    EXPECT_DOUBLE_EQ(selection.stats.total_selected_seconds, 10.0);
}

TEST(ClipSelectorTest, ClipCountCapApplies)
{
    std::vector<ClipRecord> records;
    for (int i = 0; i < 5; ++i)
        records.push_back(clip("c" + std::to_string(i) + ".mp4", 0.9 - i * 0.1, 2.0, std::nullopt));

    FingerprintAccumulator accepted;
    EXPECT_EQ(ClipSelector::selectClipsForSource(records, options(100, 90, 3, false), accepted).selected.size(), 3u);
    EXPECT_EQ(ClipSelector::selectClipsForSource(records, options(100, 90, 0, false), accepted).selected.size(), 5u);
}

TEST(ClipSelectorTest, BrightnessGateAndErrorsExcludeClips)
{
    ClipRecord dark = clip("dark.mp4", 0.99, 5.0, std::nullopt, 10.0);
    ClipRecord failed = clip("failed.mp4", 0.95, 5.0, std::nullopt);
    failed.error = "JudgeUnavailable: HTTP 500";
    ClipRecord no_quality = clip("no_quality.mp4", 0.9, 5.0, std::nullopt);
    no_quality.quality.reset();

    std::vector<ClipRecord> records = {dark, failed, no_quality, clip("ok.mp4", 0.5, 5.0, std::nullopt)};
    FingerprintAccumulator accepted;
    ClipSelection selection = ClipSelector::selectClipsForSource(records, options(60, 90, 20, true), accepted);

    EXPECT_EQ(clipPaths(selection), (std::vector<std::string>{"ok.mp4"}));
    EXPECT_EQ(selection.stats.total_clips, 4u);
    EXPECT_EQ(selection.stats.scored_clips, 3u);
}

TEST(ClipSelectorTest, GlobalAccumulatorCarriesAcrossSources)
{
    std::vector<ClipRecord> first = {clip("first/a.mp4", 0.9, 5.0, 0xFFULL)};
    std::vector<ClipRecord> second = {
        clip("second/a.mp4", 0.95, 5.0, 0xFEULL),
        clip("second/b.mp4", 0.6, 5.0, 0xFFFFFFFF00000000ULL)};

    ClipSelectionOptions opts = options(60, 90, 20, true);
    opts.scope = DedupeScope::GLOBAL;

    FingerprintAccumulator shared;
    ClipSelector::selectClipsForSource(first, opts, shared);
    ClipSelection selection = ClipSelector::selectClipsForSource(second, opts, shared);
    EXPECT_EQ(clipPaths(selection), (std::vector<std::string>{"second/b.mp4"}));
    EXPECT_EQ(selection.stats.removed_duplicates, 1u);

    FingerprintAccumulator fresh;
    EXPECT_EQ(ClipSelector::selectClipsForSource(second, opts, fresh).selected.size(), 2u);
}

TEST(ClipSelectorTest, ScoreStatistics)
{
    std::vector<ClipRecord> records;
    const double scores[] = {0.1, 0.4, 0.2, 0.9, 0.5, 0.3};
    for (size_t i = 0; i < 6; ++i)
        records.push_back(clip("c" + std::to_string(i) + ".mp4", scores[i], 1.0, std::nullopt));

    FingerprintAccumulator accepted;
    SelectionStats stats = ClipSelector::selectClipsForSource(records, options(100, 90, 0, false), accepted).stats;
    ASSERT_TRUE(stats.score_median.has_value());
    EXPECT_DOUBLE_EQ(*stats.score_min, 0.1);
    EXPECT_DOUBLE_EQ(*stats.score_max, 0.9);
    EXPECT_NEAR(*stats.score_median, 0.35, 1e-12);
    // floor(0.9 * 5) = 4 -> 0.5
    EXPECT_DOUBLE_EQ(*stats.score_p90, 0.5);

    FingerprintAccumulator empty_accepted;
    SelectionStats empty = ClipSelector::selectClipsForSource({}, options(100, 90, 0, false), empty_accepted).stats;
    EXPECT_FALSE(empty.score_median.has_value());
    EXPECT_TRUE(empty.toJson()["score_median"].is_null());
}

TEST(ClipSelectorTest, MedianAndPercentileHelpers)
{
    EXPECT_DOUBLE_EQ(ClipSelector::median({3.0, 1.0, 2.0}), 2.0);
    EXPECT_DOUBLE_EQ(ClipSelector::median({4.0, 1.0, 3.0, 2.0}), 2.5);
    EXPECT_DOUBLE_EQ(ClipSelector::percentile90({1.0}), 1.0);
    EXPECT_DOUBLE_EQ(ClipSelector::percentile90({1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0, 10.0, 11.0}), 10.0);
}

TEST(ClipSelectorTest, DurationBudgetAndScopeParsing)
{
    EXPECT_DOUBLE_EQ(ClipSelector::durationBudget(options(300, 60, 0, false)), 60.0);
    EXPECT_DOUBLE_EQ(ClipSelector::durationBudget(options(30, 60, 0, false)), 30.0);
    EXPECT_DOUBLE_EQ(ClipSelector::durationBudget(options(30, 0, 0, false)), 30.0);

    EXPECT_EQ(dedupeScopeFromString("global"), std::optional<DedupeScope>(DedupeScope::GLOBAL));
    EXPECT_EQ(dedupeScopeFromString("per_source_video"), std::optional<DedupeScope>(DedupeScope::PER_SOURCE_VIDEO));
    EXPECT_FALSE(dedupeScopeFromString("everywhere").has_value());
    EXPECT_EQ(dedupeScopeName(DedupeScope::GLOBAL), "global");
}

TEST(ClipSelectorTest, AccumulatorSerializesConcurrentAccepts)
{
    FingerprintAccumulator accepted;
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t)
    {
        workers.emplace_back([&accepted]()
                             {
                                 for (int i = 0; i < 100; ++i)
                                     accepted.tryAccept(0xABCDULL, 0);
                             });
    }
    for (auto &worker : workers)
        worker.join();
    EXPECT_EQ(accepted.size(), 1u);
}
