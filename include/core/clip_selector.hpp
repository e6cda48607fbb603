#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/media_item.hpp"

/**
 * @brief Scope of the fingerprint set used by video deduplication
 */
enum class DedupeScope
{
    PER_SOURCE_VIDEO, // Fresh set for every source file
    GLOBAL            // One running set shared by every source in the batch
};

std::string dedupeScopeName(DedupeScope scope);
std::optional<DedupeScope> dedupeScopeFromString(const std::string &value);

/**
 * @brief Running set of accepted clip fingerprints
 *
 * Passed explicitly into each per-source selection. tryAccept() checks and inserts
 * under one lock so concurrent callers are serialized in call order.
 */
class FingerprintAccumulator
{
public:
    /**
     * @brief Accept the fingerprint unless it is within threshold of an accepted one
     * @return true if accepted, false if it is a near-duplicate
     */
    bool tryAccept(uint64_t fingerprint, int threshold);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<uint64_t> accepted_;
};

/**
 * @brief Limits for one source's clip selection
 */
struct ClipSelectionOptions
{
    double max_source_seconds = 0.0;
    double target_digest_seconds = 90.0; // <= 0 means no separate digest target
    int max_selected_clips = 20;         // <= 0 means unlimited
    bool dedupe_enabled = true;
    int hamming_threshold = 6;
    DedupeScope scope = DedupeScope::PER_SOURCE_VIDEO;
};

/**
 * @brief Observability summary of one selection run
 */
struct SelectionStats
{
    size_t total_clips = 0;
    size_t scored_clips = 0;
    size_t selected_clips_count = 0;
    size_t removed_duplicates = 0;
    double total_selected_seconds = 0.0;
    std::optional<double> score_min;
    std::optional<double> score_median;
    std::optional<double> score_p90;
    std::optional<double> score_max;

    nlohmann::json toJson() const;
};

struct ClipSelection
{
    std::vector<ClipRecord> selected; // Acceptance order (descending score)
    SelectionStats stats;
};

/**
 * @brief Duration-quota clip selection
 */
class ClipSelector
{
public:
    static constexpr double MIN_BRIGHTNESS_GATE = 15.0;

    /**
     * @brief Greedily select clips for one source
     *
     * Eligible clips pass the brightness gate and are walked by descending score.
     * A clip that would overflow min(max_source_seconds, target_digest_seconds)
     * is skipped so shorter ones may still fit; the walk stops at
     * max_selected_clips or once the budget is reached.
     *
     * @param records Clip records of one source
     * @param options Budget and dedup settings
     * @param accepted Fingerprints already accepted in this scope; updated in place
     */
    static ClipSelection selectClipsForSource(const std::vector<ClipRecord> &records,
                                              const ClipSelectionOptions &options,
                                              FingerprintAccumulator &accepted);

    static bool passesQualityGate(const ClipRecord &record);
    static double durationBudget(const ClipSelectionOptions &options);

    // Median averages the two middle values for an even count
    static double median(std::vector<double> values);
    // Value at index floor(0.9 * (n - 1)) of the sorted values
    static double percentile90(std::vector<double> values);
};
