#pragma once

#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/media_item.hpp"

/**
 * @brief Judge payload that was repaired into the canonical schema
 */
struct ValidJudgeOutput
{
    JudgeAnalysis analysis;
};

/**
 * @brief Judge payload that could not be interpreted at all
 */
struct MalformedJudgeOutput
{
    std::string reason;
};

using JudgeOutput = std::variant<ValidJudgeOutput, MalformedJudgeOutput>;

/**
 * @brief Parsing boundary for untrusted judge output plus the deterministic penalty passes
 */
class ScoreNormalizer
{
public:
    // Quality correction weights, each applied as weight * PENALTY_SCALE
    static constexpr double PENALTY_SCALE = 0.5;
    static constexpr double DARK_PENALTY = 0.2;
    static constexpr double BLUR_STRONG_PENALTY = 0.4;
    static constexpr double BLUR_CENTER_PENALTY = 0.25;
    static constexpr double BLUR_LOWER_PENALTY = 0.15;
    static constexpr double LOW_RESOLUTION_PENALTY = 0.1;
    static constexpr int MIN_SHORT_SIDE = 720;

    // Risk penalty weights
    static constexpr double RISK_BLUR_PENALTY = 0.25;
    static constexpr double RISK_OUT_OF_FOCUS_PENALTY = 0.25;
    static constexpr double RISK_DARK_PENALTY = 0.15;
    static constexpr double RISK_OVEREXPOSED_PENALTY = 0.15;

    /**
     * @brief Coerce a raw judge payload into the canonical schema
     * @return MalformedJudgeOutput only when the payload is not a JSON object
     */
    static JudgeOutput parse(const nlohmann::json &raw);

    /**
     * @brief parse() that throws MediaError (InvalidJudgeResponse) on malformed input
     */
    static JudgeAnalysis normalize(const nlohmann::json &raw);

    static double applyQualityCorrections(double score, const QualityMetrics &quality, int width, int height);
    static double applyRiskPenalties(double score, const RiskFlags &risks);

    /**
     * @brief Run both penalty passes over the judge score
     */
    static double finalScore(const JudgeAnalysis &analysis, const QualityMetrics &quality, int width, int height);

    static std::optional<double> coerceDouble(const nlohmann::json &value);
    static bool coerceFlag(const nlohmann::json &value);
    static double clamp01(double value);
};
