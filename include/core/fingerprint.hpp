#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @brief 64-bit average-hash fingerprint used for near-duplicate detection
 *
 * The image is converted to grayscale, resized to 8x8 with area resampling and
 * each of the 64 samples sets bit i (row-major) when it is >= the mean sample.
 */
class Fingerprint
{
public:
    static constexpr int HASH_SIZE = 8;
    static constexpr int DEFAULT_NEAR_DUPLICATE_THRESHOLD = 8;

    /**
     * @brief Compute the fingerprint of an already decoded image
     * @param image BGR, BGRA or single channel 8-bit image
     * @return 64-bit fingerprint
     */
    static uint64_t compute(const cv::Mat &image);

    /**
     * @brief Decode a file and compute its fingerprint
     * @throws MediaError (DecodeFailure) when the file cannot be decoded
     */
    static uint64_t fromFile(const std::string &file_path);

    static int hammingDistance(uint64_t left, uint64_t right);

    static bool isNearDuplicate(uint64_t candidate, const std::vector<uint64_t> &accepted, int threshold);

    // Zero-padded, 16 lowercase hex digits
    static std::string toHex(uint64_t value);
    static std::optional<uint64_t> fromHex(const std::string &hex);
};
