#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Output layout of a photo batch
 */
struct PhotoOutputPaths
{
    fs::path output_dir;
    fs::path selected_dir;
    fs::path scores_dir;
    fs::path manifest_path;
    fs::path db_path;
};

/**
 * @brief Output layout of a video batch
 */
struct VideoOutputPaths
{
    fs::path output_dir;
    fs::path scores_dir;
    fs::path temp_dir;
    fs::path digest_clips_dir;
    fs::path manifest_path;
};

class OutputPaths
{
public:
    static constexpr const char *TEMP_DIR_NAME = "temp";
    static constexpr const char *CLIPS_DIR_NAME = "clips";

    static PhotoOutputPaths photo(const fs::path &output_dir);
    static VideoOutputPaths video(const fs::path &output_dir);

    static fs::path digestClipsSourceDir(const VideoOutputPaths &paths, const std::string &source_stem);
    static fs::path finalDigestPath(const VideoOutputPaths &paths, const std::string &source_stem);
    static fs::path concatListPath(const VideoOutputPaths &paths, const std::string &label);
    static fs::path splitClipsDir(const VideoOutputPaths &paths);
    static fs::path framesDir(const VideoOutputPaths &paths);

    /**
     * @brief Per-source directory and file label keyed by source path
     *
     * The file stem, or stem_2, stem_3... for later sources whose stem is already taken.
     */
    static std::map<std::string, std::string> sourceLabels(const std::vector<fs::path> &sources);
};
