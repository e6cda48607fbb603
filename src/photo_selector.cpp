#include "core/photo_selector.hpp"
#include "logging/logger.hpp"
#include <algorithm>

void PhotoSelector::sortByScore(std::vector<MediaItem> &photos)
{
    std::stable_sort(photos.begin(), photos.end(), [](const MediaItem &left, const MediaItem &right)
                     { return *left.final_score > *right.final_score; });
}

std::vector<MediaItem> PhotoSelector::eligibleByScore(const std::vector<MediaItem> &photos)
{
    std::vector<MediaItem> eligible;
    for (const auto &photo : photos)
    {
        if (photo.isEligible())
            eligible.push_back(photo);
    }
    sortByScore(eligible);
    return eligible;
}

std::vector<MediaItem> PhotoSelector::selectTopPhotos(const std::vector<MediaItem> &photos, size_t target_count,
                                                      int hamming_threshold, bool dedupe_enabled)
{
    std::vector<MediaItem> ordered = eligibleByScore(photos);

    if (!dedupe_enabled)
    {
        if (ordered.size() > target_count)
            ordered.resize(target_count);
        return ordered;
    }

    std::vector<MediaItem> candidates;
    std::vector<uint64_t> cluster_hashes;
    size_t dropped = 0;

    for (const auto &photo : ordered)
    {
        if (!photo.fingerprint)
        {
            candidates.push_back(photo);
            continue;
        }

        bool assigned = false;
        for (size_t idx = 0; idx < cluster_hashes.size(); ++idx)
        {
            if (Fingerprint::hammingDistance(*photo.fingerprint, cluster_hashes[idx]) <= hamming_threshold)
            {
                dropped++;
                assigned = true;
                Logger::debug("Near-duplicate of cluster " + std::to_string(idx) + " dropped: " + photo.path);
                break;
            }
        }
        if (!assigned)
        {
            cluster_hashes.push_back(*photo.fingerprint);
            candidates.push_back(photo);
        }
    }

    sortByScore(candidates);
    Logger::info("Photo selection: " + std::to_string(ordered.size()) + " eligible, " +
                 std::to_string(cluster_hashes.size()) + " clusters, " +
                 std::to_string(dropped) + " near-duplicates dropped");

    if (target_count >= candidates.size())
        return candidates;

    candidates.resize(target_count);
    return candidates;
}
