#include "core/quality_analyzer.hpp"
#include "core/media_error.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

cv::Mat QualityAnalyzer::toGray(const cv::Mat &image)
{
    cv::Mat gray;
    if (image.channels() == 3)
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    else if (image.channels() == 4)
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    else
        gray = image;

    if (gray.depth() != CV_8U)
    {
        cv::Mat converted;
        gray.convertTo(converted, CV_8U);
        return converted;
    }
    return gray;
}

double QualityAnalyzer::edgeVariance(const cv::Mat &gray)
{
    if (gray.empty())
        return 0.0;

    // 8-neighbour edge kernel, saturated to 8 bits like a grayscale edge image
    static const cv::Mat kernel = (cv::Mat_<float>(3, 3) << -1, -1, -1,
                                   -1, 8, -1,
                                   -1, -1, -1);
    cv::Mat edges;
    cv::filter2D(gray, edges, CV_8U, kernel, cv::Point(-1, -1), 0.0, cv::BORDER_REPLICATE);

    cv::Scalar mean, stddev;
    cv::meanStdDev(edges, mean, stddev);
    return stddev[0] * stddev[0];
}

cv::Rect QualityAnalyzer::centerRegion(int width, int height)
{
    int left = static_cast<int>(width * 0.25);
    int right = static_cast<int>(width * 0.75);
    int top = static_cast<int>(height * 0.25);
    int bottom = static_cast<int>(height * 0.75);
    return cv::Rect(left, top, std::max(0, right - left), std::max(0, bottom - top));
}

cv::Rect QualityAnalyzer::lowerRegion(int width, int height)
{
    int left = static_cast<int>(width * 0.1);
    int right = static_cast<int>(width * 0.9);
    int top = static_cast<int>(height * 0.5);
    int bottom = static_cast<int>(height * 0.95);
    return cv::Rect(left, top, std::max(0, right - left), std::max(0, bottom - top));
}

QualityMetrics QualityAnalyzer::analyze(const cv::Mat &image)
{
    cv::Mat gray = toGray(image);

    QualityMetrics quality;
    quality.brightness = cv::mean(gray)[0];
    quality.resolution = static_cast<double>(gray.cols) * static_cast<double>(gray.rows);
    quality.edge_variance = edgeVariance(gray);

    cv::Rect center = centerRegion(gray.cols, gray.rows);
    quality.center_edge_variance = center.area() > 0 ? edgeVariance(gray(center)) : 0.0;

    cv::Rect lower = lowerRegion(gray.cols, gray.rows);
    quality.lower_edge_variance = lower.area() > 0 ? edgeVariance(gray(lower)) : 0.0;

    quality.dark = quality.brightness < DARK_BRIGHTNESS;
    quality.overexposed = quality.brightness > OVEREXPOSED_BRIGHTNESS;
    quality.blur = quality.edge_variance < MIN_EDGE_VARIANCE;
    quality.blur_center = quality.center_edge_variance < MIN_CENTER_EDGE_VARIANCE;
    quality.blur_lower = quality.lower_edge_variance < MIN_LOWER_EDGE_VARIANCE;
    quality.blur_strong = quality.center_edge_variance < MIN_STRONG_CENTER_VARIANCE;
    return quality;
}

QualityMetrics QualityAnalyzer::analyzeFile(const std::string &file_path)
{
    cv::Mat image;
    try
    {
        image = cv::imread(file_path, cv::IMREAD_COLOR);
    }
    catch (const cv::Exception &e)
    {
        throw MediaError(MediaErrorKind::DECODE_FAILURE, "OpenCV error reading " + file_path + ": " + e.what());
    }
    if (image.empty())
    {
        throw MediaError(MediaErrorKind::DECODE_FAILURE, "Failed to load image: " + file_path);
    }

    Logger::debug("Analyzing quality of " + file_path + " (" + std::to_string(image.cols) + "x" + std::to_string(image.rows) + ")");
    return analyze(image);
}
