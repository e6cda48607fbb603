#include "core/clip_selector.hpp"
#include "core/fingerprint.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>

using json = nlohmann::json;

std::string dedupeScopeName(DedupeScope scope)
{
    return scope == DedupeScope::GLOBAL ? "global" : "per_source_video";
}

std::optional<DedupeScope> dedupeScopeFromString(const std::string &value)
{
    if (value == "per_source_video" || value == "per_source")
        return DedupeScope::PER_SOURCE_VIDEO;
    if (value == "global")
        return DedupeScope::GLOBAL;
    return std::nullopt;
}

bool FingerprintAccumulator::tryAccept(uint64_t fingerprint, int threshold)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (Fingerprint::isNearDuplicate(fingerprint, accepted_, threshold))
        return false;
    accepted_.push_back(fingerprint);
    return true;
}

size_t FingerprintAccumulator::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return accepted_.size();
}

json SelectionStats::toJson() const
{
    auto optional = [](const std::optional<double> &value)
    {
        return value ? json(*value) : json(nullptr);
    };
    return json{
        {"total_clips", total_clips},
        {"scored_clips", scored_clips},
        {"selected_clips_count", selected_clips_count},
        {"removed_duplicates", removed_duplicates},
        {"total_selected_seconds", total_selected_seconds},
        {"score_min", optional(score_min)},
        {"score_median", optional(score_median)},
        {"score_p90", optional(score_p90)},
        {"score_max", optional(score_max)}};
}

bool ClipSelector::passesQualityGate(const ClipRecord &record)
{
    if (!record.quality)
        return false;
    return record.quality->brightness >= MIN_BRIGHTNESS_GATE;
}

double ClipSelector::durationBudget(const ClipSelectionOptions &options)
{
    if (options.target_digest_seconds <= 0.0)
        return options.max_source_seconds;
    return std::min(options.max_source_seconds, options.target_digest_seconds);
}

double ClipSelector::median(std::vector<double> values)
{
    if (values.empty())
        return 0.0;
    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 1)
        return values[mid];
    return (values[mid - 1] + values[mid]) / 2.0;
}

double ClipSelector::percentile90(std::vector<double> values)
{
    if (values.empty())
        return 0.0;
    std::sort(values.begin(), values.end());
    size_t index = static_cast<size_t>(std::floor(0.9 * static_cast<double>(values.size() - 1)));
    return values[index];
}

ClipSelection ClipSelector::selectClipsForSource(const std::vector<ClipRecord> &records,
                                                 const ClipSelectionOptions &options,
                                                 FingerprintAccumulator &accepted)
{
    ClipSelection result;
    result.stats.total_clips = records.size();

    std::vector<double> scores;
    std::vector<ClipRecord> eligible;
    for (const auto &record : records)
    {
        if (!record.isEligible())
            continue;
        scores.push_back(*record.score_final);
        if (passesQualityGate(record))
            eligible.push_back(record);
    }
    result.stats.scored_clips = scores.size();
    if (!scores.empty())
    {
        result.stats.score_min = *std::min_element(scores.begin(), scores.end());
        result.stats.score_max = *std::max_element(scores.begin(), scores.end());
        result.stats.score_median = median(scores);
        result.stats.score_p90 = percentile90(scores);
    }

    std::stable_sort(eligible.begin(), eligible.end(), [](const ClipRecord &left, const ClipRecord &right)
                     { return *left.score_final > *right.score_final; });

    const double budget = durationBudget(options);
    double total = 0.0;

    for (const auto &record : eligible)
    {
        if (options.max_selected_clips > 0 &&
            result.selected.size() >= static_cast<size_t>(options.max_selected_clips))
            break;

        const double duration = record.clip.duration;
        if (total + duration > budget)
            continue;

        if (options.dedupe_enabled && record.fingerprint &&
            !accepted.tryAccept(*record.fingerprint, options.hamming_threshold))
        {
            result.stats.removed_duplicates++;
            Logger::debug("Duplicate clip skipped: " + record.clip.clip_path);
            continue;
        }

        result.selected.push_back(record);
        total += duration;
        if (total >= budget)
            break;
    }

    result.stats.selected_clips_count = result.selected.size();
    result.stats.total_selected_seconds = total;
    return result;
}
