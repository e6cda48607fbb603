#include "core/score_normalizer.hpp"
#include "core/media_error.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

using json = nlohmann::json;

namespace
{
    std::string trim(const std::string &value)
    {
        auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c)
                                      { return std::isspace(c); });
        auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c)
                                    { return std::isspace(c); })
                       .base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    double scoreField(const json &raw, const char *key)
    {
        if (!raw.contains(key))
            return 0.0;
        return ScoreNormalizer::clamp01(ScoreNormalizer::coerceDouble(raw[key]).value_or(0.0));
    }
}

std::optional<double> ScoreNormalizer::coerceDouble(const json &value)
{
    if (value.is_number())
    {
        double number = value.get<double>();
        if (std::isnan(number))
            return std::nullopt;
        return number;
    }
    if (value.is_string())
    {
        const std::string text = trim(value.get<std::string>());
        if (text.empty())
            return std::nullopt;
        try
        {
            size_t consumed = 0;
            double number = std::stod(text, &consumed);
            if (consumed != text.size() || std::isnan(number))
                return std::nullopt;
            return number;
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool ScoreNormalizer::coerceFlag(const json &value)
{
    if (value.is_boolean())
        return value.get<bool>();
    if (value.is_number())
        return value.get<double>() != 0.0;
    if (value.is_string())
    {
        std::string text = trim(value.get<std::string>());
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text == "true" || text == "yes" || text == "on" || text == "1";
    }
    return false;
}

double ScoreNormalizer::clamp01(double value)
{
    if (value < 0.0)
        return 0.0;
    if (value > 1.0)
        return 1.0;
    return value;
}

JudgeOutput ScoreNormalizer::parse(const json &raw)
{
    if (!raw.is_object())
    {
        return MalformedJudgeOutput{"Analysis is not a JSON object"};
    }

    JudgeAnalysis analysis;

    if (raw.contains("caption") && raw["caption"].is_string())
        analysis.caption = raw["caption"].get<std::string>();

    if (raw.contains("tags") && raw["tags"].is_array())
    {
        for (const auto &tag : raw["tags"])
        {
            if (tag.is_string())
                analysis.tags.push_back(tag.get<std::string>());
        }
    }

    if (raw.contains("risks") && raw["risks"].is_object())
    {
        const json &risks = raw["risks"];
        analysis.risks.blur = risks.contains("blur") && coerceFlag(risks["blur"]);
        analysis.risks.dark = risks.contains("dark") && coerceFlag(risks["dark"]);
        analysis.risks.overexposed = risks.contains("overexposed") && coerceFlag(risks["overexposed"]);
        analysis.risks.out_of_focus = risks.contains("out_of_focus") && coerceFlag(risks["out_of_focus"]);
    }

    // overall_score wins over score when both are usable
    std::optional<double> overall;
    if (raw.contains("overall_score"))
        overall = coerceDouble(raw["overall_score"]);
    if (!overall && raw.contains("score"))
        overall = coerceDouble(raw["score"]);

    analysis.overall_score = clamp01(overall.value_or(0.0));
    analysis.score = analysis.overall_score;
    analysis.sharpness = scoreField(raw, "sharpness");
    analysis.subject_visibility = scoreField(raw, "subject_visibility");
    analysis.composition = scoreField(raw, "composition");
    analysis.duplication_penalty = scoreField(raw, "duplication_penalty");

    if (raw.contains("reasoning") && raw["reasoning"].is_string())
        analysis.reasoning = trim(raw["reasoning"].get<std::string>());

    return ValidJudgeOutput{analysis};
}

JudgeAnalysis ScoreNormalizer::normalize(const json &raw)
{
    JudgeOutput output = parse(raw);
    if (const auto *malformed = std::get_if<MalformedJudgeOutput>(&output))
    {
        throw MediaError(MediaErrorKind::INVALID_JUDGE_RESPONSE, malformed->reason);
    }
    return std::get<ValidJudgeOutput>(output).analysis;
}

double ScoreNormalizer::applyQualityCorrections(double score, const QualityMetrics &quality, int width, int height)
{
    if (quality.dark)
        score -= DARK_PENALTY * PENALTY_SCALE;
    if (quality.blur_strong)
        score -= BLUR_STRONG_PENALTY * PENALTY_SCALE;
    if (quality.blur_center)
        score -= BLUR_CENTER_PENALTY * PENALTY_SCALE;
    if (quality.blur_lower)
        score -= BLUR_LOWER_PENALTY * PENALTY_SCALE;

    if (std::min(width, height) < MIN_SHORT_SIDE)
        score -= LOW_RESOLUTION_PENALTY;

    return clamp01(score);
}

double ScoreNormalizer::applyRiskPenalties(double score, const RiskFlags &risks)
{
    if (risks.blur)
        score -= RISK_BLUR_PENALTY * PENALTY_SCALE;
    if (risks.out_of_focus)
        score -= RISK_OUT_OF_FOCUS_PENALTY * PENALTY_SCALE;
    if (risks.dark)
        score -= RISK_DARK_PENALTY * PENALTY_SCALE;
    if (risks.overexposed)
        score -= RISK_OVEREXPOSED_PENALTY * PENALTY_SCALE;

    return clamp01(score);
}

double ScoreNormalizer::finalScore(const JudgeAnalysis &analysis, const QualityMetrics &quality, int width, int height)
{
    double score = applyQualityCorrections(analysis.overall_score, quality, width, height);
    return applyRiskPenalties(score, analysis.risks);
}
