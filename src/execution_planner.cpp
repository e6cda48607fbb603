#include "core/execution_planner.hpp"
#include "core/file_utils.hpp"
#include "core/fingerprint.hpp"
#include "core/output_paths.hpp"
#include "core/score_cache.hpp"
#include "logging/logger.hpp"
#include <map>
#include <set>
#include <tbb/parallel_for.h>

using json = nlohmann::json;

json ExecutionPlan::toJson() const
{
    json plan = {
        {"type", type},
        {"files_to_process", files_to_process},
        {"files_to_skip", files_to_skip},
        {"estimated_output_paths", estimated_output_paths}};
    if (type == "photo")
    {
        plan["resume"] = resume;
    }
    else
    {
        plan["preset"] = preset ? json(*preset) : json(nullptr);
        plan["concat_in_digest_folder"] = concat_in_digest_folder;
    }
    return plan;
}

std::vector<std::string> ExecutionPlanner::dedupePreservingOrder(const std::vector<std::string> &items)
{
    std::set<std::string> seen;
    std::vector<std::string> result;
    for (const auto &item : items)
    {
        if (seen.insert(item).second)
            result.push_back(item);
    }
    return result;
}

ExecutionPlan ExecutionPlanner::photoPlan(const fs::path &input_dir, const fs::path &output_dir, bool resume,
                                          bool force)
{
    ExecutionPlan plan;
    plan.type = "photo";
    plan.resume = resume && !force;

    const PhotoOutputPaths paths = OutputPaths::photo(output_dir);
    const std::vector<fs::path> image_paths = FileUtils::collectImagePaths(input_dir);

    std::vector<std::optional<std::string>> hashes(image_paths.size());
    if (plan.resume)
    {
        tbb::parallel_for(size_t(0), image_paths.size(), [&](size_t i)
                          {
                              try
                              {
                                  hashes[i] = Fingerprint::toHex(Fingerprint::fromFile(image_paths[i].string()));
                              }
                              catch (const std::exception &e)
                              {
                                  Logger::warn("Cannot fingerprint " + image_paths[i].string() + ": " + e.what());
                              } });
    }

    std::optional<ScoreCache> cache;
    if (plan.resume)
        cache.emplace(paths.db_path.string(), ScoreCache::Mode::READ_ONLY);

    for (size_t i = 0; i < image_paths.size(); ++i)
    {
        const std::string path = image_paths[i].string();
        if (cache && hashes[i] && cache->get(path, *hashes[i]))
        {
            plan.files_to_skip.push_back(path);
            continue;
        }
        plan.files_to_process.push_back(path);
    }

    std::vector<std::string> outputs = {
        paths.scores_dir.string(),
        paths.manifest_path.string(),
        paths.db_path.string(),
        paths.selected_dir.string()};
    for (const auto &path : plan.files_to_process)
    {
        outputs.push_back((paths.selected_dir / fs::path(path).filename()).string());
    }
    plan.estimated_output_paths = dedupePreservingOrder(outputs);
    return plan;
}

ExecutionPlan ExecutionPlanner::videoPlan(const fs::path &input, const fs::path &output_dir, const std::string &preset,
                                          bool concat_in_digest_folder)
{
    ExecutionPlan plan;
    plan.type = "video";
    plan.preset = preset;
    plan.concat_in_digest_folder = concat_in_digest_folder;

    const VideoOutputPaths paths = OutputPaths::video(output_dir);
    const std::vector<fs::path> video_paths = FileUtils::collectVideoPaths(input);

    std::vector<std::string> outputs = {
        paths.scores_dir.string(),
        paths.manifest_path.string(),
        paths.digest_clips_dir.string(),
        paths.temp_dir.string()};

    const std::map<std::string, std::string> labels = OutputPaths::sourceLabels(video_paths);
    for (const auto &video : video_paths)
    {
        plan.files_to_process.push_back(video.string());

        const std::string stem = labels.at(video.string());
        const fs::path source_dir = OutputPaths::digestClipsSourceDir(paths, stem);
        outputs.push_back((source_dir / "clip_*.mp4").string());
        if (preset != "clips_only")
        {
            outputs.push_back(OutputPaths::finalDigestPath(paths, stem).string());
            outputs.push_back(OutputPaths::concatListPath(paths, stem + "_root").string());
        }
        if (concat_in_digest_folder)
        {
            outputs.push_back((source_dir / "digest.mp4").string());
            outputs.push_back(OutputPaths::concatListPath(paths, stem + "_folder").string());
        }
    }
    plan.estimated_output_paths = dedupePreservingOrder(outputs);
    return plan;
}
