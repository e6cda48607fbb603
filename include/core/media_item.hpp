#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Pixel-level quality measurements of one decoded image
 */
struct QualityMetrics
{
    double brightness = 0.0;           // Mean luma, 0-255
    double resolution = 0.0;           // width * height
    double edge_variance = 0.0;        // Whole frame
    double center_edge_variance = 0.0; // Central 50% x 50% crop
    double lower_edge_variance = 0.0;  // Lower band, 10-90% x 50-95%
    bool dark = false;
    bool overexposed = false;
    bool blur = false;
    bool blur_center = false;
    bool blur_lower = false;
    bool blur_strong = false;
};

/**
 * @brief Risk flags self-reported by the judge
 */
struct RiskFlags
{
    bool blur = false;
    bool dark = false;
    bool overexposed = false;
    bool out_of_focus = false;
};

/**
 * @brief Canonical judge analysis after normalization
 */
struct JudgeAnalysis
{
    std::string caption;
    std::vector<std::string> tags;
    RiskFlags risks;
    double score = 0.0; // Final score once penalties are applied
    double overall_score = 0.0;
    double sharpness = 0.0;
    double subject_visibility = 0.0;
    double composition = 0.0;
    double duplication_penalty = 0.0;
    std::string reasoning;
};

/**
 * @brief One input photo moving through a batch
 */
struct MediaItem
{
    std::string path;
    std::optional<uint64_t> fingerprint;
    int width = 0;
    int height = 0;
    std::string orientation;
    std::optional<QualityMetrics> quality;
    std::optional<JudgeAnalysis> analysis;
    std::optional<double> final_score;
    std::optional<std::string> error;
    bool selected = false;
    bool from_cache = false;

    bool isEligible() const { return !error.has_value() && final_score.has_value(); }
};

/**
 * @brief One fixed-duration segment cut from a source video
 */
struct ClipInfo
{
    std::string source_path;
    std::string clip_path;
    double start = 0.0;
    double end = 0.0;
    double duration = 0.0;
    int width = 0;
    int height = 0;
    double fps = 0.0;
};

/**
 * @brief A clip plus everything learned about its representative frame
 */
struct ClipRecord
{
    ClipInfo clip;
    std::string frame_path;
    int frame_width = 0;
    int frame_height = 0;
    std::string frame_orientation;
    std::optional<uint64_t> fingerprint;
    std::optional<QualityMetrics> quality;
    std::optional<JudgeAnalysis> analysis;
    std::optional<double> score_final;
    std::optional<std::string> error;

    bool isEligible() const { return !error.has_value() && score_final.has_value(); }
};

std::string computeOrientation(int width, int height);

nlohmann::json qualityToJson(const QualityMetrics &quality);
std::optional<QualityMetrics> qualityFromJson(const nlohmann::json &value);

nlohmann::json analysisToJson(const JudgeAnalysis &analysis);
nlohmann::json mediaItemToJson(const MediaItem &item);
nlohmann::json clipRecordToJson(const ClipRecord &record);
