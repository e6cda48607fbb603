#include "core/media_item.hpp"
#include "core/fingerprint.hpp"

using json = nlohmann::json;

std::string computeOrientation(int width, int height)
{
    if (width == height)
        return "square";
    if (width > height)
        return "landscape";
    return "portrait";
}

json qualityToJson(const QualityMetrics &quality)
{
    return json{
        {"brightness", quality.brightness},
        {"resolution", quality.resolution},
        {"edge_variance", quality.edge_variance},
        {"center_edge_variance", quality.center_edge_variance},
        {"lower_edge_variance", quality.lower_edge_variance},
        {"dark", quality.dark},
        {"overexposed", quality.overexposed},
        {"blur", quality.blur},
        {"blur_center", quality.blur_center},
        {"blur_lower", quality.blur_lower},
        {"blur_strong", quality.blur_strong}};
}

std::optional<QualityMetrics> qualityFromJson(const json &value)
{
    if (!value.is_object())
        return std::nullopt;

    QualityMetrics quality;
    quality.brightness = value.value("brightness", 0.0);
    quality.resolution = value.value("resolution", 0.0);
    quality.edge_variance = value.value("edge_variance", 0.0);
    quality.center_edge_variance = value.value("center_edge_variance", 0.0);
    quality.lower_edge_variance = value.value("lower_edge_variance", 0.0);
    quality.dark = value.value("dark", false);
    quality.overexposed = value.value("overexposed", false);
    quality.blur = value.value("blur", false);
    quality.blur_center = value.value("blur_center", false);
    quality.blur_lower = value.value("blur_lower", false);
    quality.blur_strong = value.value("blur_strong", false);
    return quality;
}

json analysisToJson(const JudgeAnalysis &analysis)
{
    return json{
        {"caption", analysis.caption},
        {"tags", analysis.tags},
        {"risks", {{"blur", analysis.risks.blur}, {"dark", analysis.risks.dark}, {"overexposed", analysis.risks.overexposed}, {"out_of_focus", analysis.risks.out_of_focus}}},
        {"score", analysis.score},
        {"overall_score", analysis.overall_score},
        {"sharpness", analysis.sharpness},
        {"subject_visibility", analysis.subject_visibility},
        {"composition", analysis.composition},
        {"duplication_penalty", analysis.duplication_penalty},
        {"reasoning", analysis.reasoning}};
}

json mediaItemToJson(const MediaItem &item)
{
    json record = {
        {"path", item.path},
        {"width", item.width},
        {"height", item.height},
        {"orientation", item.orientation},
        {"selected", item.selected},
        {"from_cache", item.from_cache}};
    record["hash"] = item.fingerprint ? json(Fingerprint::toHex(*item.fingerprint)) : json(nullptr);
    record["quality"] = item.quality ? qualityToJson(*item.quality) : json(nullptr);
    record["analysis"] = item.analysis ? analysisToJson(*item.analysis) : json(nullptr);
    record["score_final"] = item.final_score ? json(*item.final_score) : json(nullptr);
    record["error"] = item.error ? json(*item.error) : json(nullptr);
    return record;
}

json clipRecordToJson(const ClipRecord &record)
{
    json value = {
        {"source_path", record.clip.source_path},
        {"clip_path", record.clip.clip_path},
        {"start", record.clip.start},
        {"end", record.clip.end},
        {"duration", record.clip.duration},
        {"clip_width", record.clip.width},
        {"clip_height", record.clip.height},
        {"clip_fps", record.clip.fps}};
    value["frame_path"] = record.frame_path.empty() ? json(nullptr) : json(record.frame_path);
    value["frame_width"] = record.frame_width;
    value["frame_height"] = record.frame_height;
    value["frame_orientation"] = record.frame_orientation;
    value["frame_hash"] = record.fingerprint ? json(Fingerprint::toHex(*record.fingerprint)) : json(nullptr);
    value["quality"] = record.quality ? qualityToJson(*record.quality) : json(nullptr);
    value["analysis"] = record.analysis ? analysisToJson(*record.analysis) : json(nullptr);
    value["score_final"] = record.score_final ? json(*record.score_final) : json(nullptr);
    value["error"] = record.error ? json(*record.error) : json(nullptr);
    return value;
}
