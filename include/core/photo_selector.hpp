#pragma once

#include <cstddef>
#include <vector>
#include "core/fingerprint.hpp"
#include "core/media_item.hpp"

/**
 * @brief Count-quota photo selection with near-duplicate clustering
 */
class PhotoSelector
{
public:
    /**
     * @brief Pick at most target_count photos, best score first
     *
     * Eligible photos (no error, score present) are walked in descending score
     * order. A photo within hamming_threshold of an existing cluster
     * representative joins that cluster and is dropped; otherwise it becomes a
     * new representative. Photos without a fingerprint are never clustered.
     *
     * @param photos Candidate photos
     * @param target_count Maximum number of photos to return
     * @param hamming_threshold Maximum bit distance for two photos to be duplicates
     * @param dedupe_enabled When false, returns the plain top target_count by score
     * @return Selected photos in descending score order
     */
    static std::vector<MediaItem> selectTopPhotos(const std::vector<MediaItem> &photos, size_t target_count,
                                                  int hamming_threshold = Fingerprint::DEFAULT_NEAR_DUPLICATE_THRESHOLD,
                                                  bool dedupe_enabled = true);

private:
    static std::vector<MediaItem> eligibleByScore(const std::vector<MediaItem> &photos);
    static void sortByScore(std::vector<MediaItem> &photos);
};
