#pragma once

#include <string>
#include <opencv2/core.hpp>
#include "core/media_item.hpp"

/**
 * @brief Brightness and multi-region sharpness heuristics
 *
 * Sharpness is the variance of a 3x3 "find edges" filter response, measured over
 * the whole frame, the central 50% crop and a lower band where a seated subject
 * usually sits.
 */
class QualityAnalyzer
{
public:
    static constexpr double DARK_BRIGHTNESS = 50.0;
    static constexpr double OVEREXPOSED_BRIGHTNESS = 205.0;
    static constexpr double MIN_EDGE_VARIANCE = 140.0;
    static constexpr double MIN_CENTER_EDGE_VARIANCE = 220.0;
    static constexpr double MIN_LOWER_EDGE_VARIANCE = 180.0;
    static constexpr double MIN_STRONG_CENTER_VARIANCE = 140.0;

    /**
     * @brief Analyze an already decoded image
     * @param image BGR, BGRA or single channel 8-bit image
     */
    static QualityMetrics analyze(const cv::Mat &image);

    /**
     * @brief Decode a file and analyze it
     * @throws MediaError (DecodeFailure) when the file cannot be decoded
     */
    static QualityMetrics analyzeFile(const std::string &file_path);

    // Variance of the edge response over an 8-bit grayscale image
    static double edgeVariance(const cv::Mat &gray);

    static cv::Rect centerRegion(int width, int height);
    static cv::Rect lowerRegion(int width, int height);

private:
    static cv::Mat toGray(const cv::Mat &image);
};
