#include "core/output_paths.hpp"
#include <set>

PhotoOutputPaths OutputPaths::photo(const fs::path &output_dir)
{
    PhotoOutputPaths paths;
    paths.output_dir = output_dir;
    paths.selected_dir = output_dir / "selected";
    paths.scores_dir = output_dir / "scores";
    paths.manifest_path = paths.scores_dir / "manifest.photos.json";
    paths.db_path = paths.scores_dir / "photo_scores.sqlite";
    return paths;
}

VideoOutputPaths OutputPaths::video(const fs::path &output_dir)
{
    VideoOutputPaths paths;
    paths.output_dir = output_dir;
    paths.scores_dir = output_dir / "scores";
    paths.temp_dir = output_dir / TEMP_DIR_NAME;
    paths.digest_clips_dir = output_dir / "digest_clips";
    paths.manifest_path = paths.scores_dir / "manifest.videos.json";
    return paths;
}

fs::path OutputPaths::digestClipsSourceDir(const VideoOutputPaths &paths, const std::string &source_stem)
{
    return paths.digest_clips_dir / source_stem;
}

fs::path OutputPaths::finalDigestPath(const VideoOutputPaths &paths, const std::string &source_stem)
{
    return paths.output_dir / (source_stem + "_digest.mp4");
}

fs::path OutputPaths::concatListPath(const VideoOutputPaths &paths, const std::string &label)
{
    return paths.temp_dir / "concat" / (label + ".txt");
}

fs::path OutputPaths::splitClipsDir(const VideoOutputPaths &paths)
{
    return paths.temp_dir / CLIPS_DIR_NAME;
}

fs::path OutputPaths::framesDir(const VideoOutputPaths &paths)
{
    return paths.temp_dir / "frames";
}

std::map<std::string, std::string> OutputPaths::sourceLabels(const std::vector<fs::path> &sources)
{
    std::map<std::string, std::string> labels;
    std::set<std::string> used;
    for (const auto &source : sources)
    {
        const std::string stem = source.stem().string();
        std::string label = stem;
        for (int suffix = 2; used.count(label) > 0; ++suffix)
            label = stem + "_" + std::to_string(suffix);
        used.insert(label);
        labels[source.string()] = label;
    }
    return labels;
}
