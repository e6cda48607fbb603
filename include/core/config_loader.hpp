#pragma once

#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>
#include "core/clip_selector.hpp"

/**
 * @brief Photo command options as given on the command line
 *
 * Unset optionals and false flags may still be filled from the config file.
 */
struct PhotoOptions
{
    std::optional<std::string> config_path;
    std::optional<std::string> input;
    std::optional<std::string> output;
    std::optional<std::string> model;
    std::optional<std::string> base_url;
    std::optional<int> target_count;
    std::optional<bool> dedupe;
    std::optional<int> hamming_threshold;
    bool resume = false;
    bool force = false;
    bool dry_run = false;
};

struct VideoOptions
{
    std::optional<std::string> config_path;
    std::optional<std::string> input;
    std::optional<std::string> output;
    std::optional<std::string> model;
    std::optional<std::string> base_url;
    std::optional<std::string> preset;
    std::optional<double> max_source_seconds;
    std::optional<int> min_clip;
    std::optional<int> max_clip;
    std::optional<bool> video_dedupe;
    std::optional<int> video_dedupe_hamming_threshold;
    std::optional<std::string> video_dedupe_scope;
    std::optional<int> video_max_selected_clips;
    std::optional<double> video_target_digest_seconds;
    bool use_hwaccel = false;
    bool keep_temp = false;
    bool concat_in_digest_folder = false;
    bool delete_split_files = false;
    bool dry_run = false;
};

/**
 * @brief Fully resolved photo batch settings
 */
struct PhotoSettings
{
    std::string input_dir;
    std::string output_dir;
    std::string model;
    std::string base_url;
    int target_count = 0;
    bool resume = false;
    bool force = false;
    bool dedupe_enabled = true;
    int hamming_threshold = 8;
    bool dry_run = false;
};

/**
 * @brief Fully resolved video batch settings
 */
struct VideoSettings
{
    std::string input;
    std::string output_dir;
    std::string model;
    std::string base_url;
    std::string preset = "youtube16x9";
    double max_source_seconds = 0.0;
    int min_clip = 2;
    int max_clip = 6;
    bool use_hwaccel = false;
    bool keep_temp = false;
    bool concat_in_digest_folder = false;
    bool delete_split_files = false;
    bool dry_run = false;
    ClipSelectionOptions selection;
};

/**
 * @brief Merges YAML config files and environment defaults into command options
 *
 * Precedence: command line, then top-level config keys, then (video only) keys
 * of a nested "video:" mapping, then OLLAMA_MODEL / OLLAMA_BASE_URL, then built-in
 * defaults. Every failure is a ConfigError.
 */
class ConfigLoader
{
public:
    static constexpr const char *DEFAULT_BASE_URL = "http://localhost:11434";

    /**
     * @brief Load a YAML mapping; an empty document is an empty mapping
     * @throws ConfigError when the file is missing, unparsable or not a mapping
     */
    static YAML::Node loadFile(const std::string &path);

    static void applyPhotoConfig(PhotoOptions &options, const YAML::Node &config);
    static void applyVideoConfig(VideoOptions &options, const YAML::Node &config);

    // Loads options.config_path when set, merges, applies defaults and validates
    static PhotoSettings resolvePhoto(PhotoOptions options);
    static VideoSettings resolveVideo(VideoOptions options);

    /**
     * @brief Accepts YAML booleans and true/false/yes/no/on/off/1/0
     * @return nullopt when the value is not recognizable as a boolean
     */
    static std::optional<bool> coerceBool(const YAML::Node &node);
    static std::optional<bool> coerceBool(const std::string &value);

    static bool isValidPreset(const std::string &preset);

private:
    static YAML::Node lookup(const YAML::Node &config, const std::string &key, const std::string &nested_section = "");
    static std::optional<std::string> envValue(const char *name);

    template <typename T>
    static void fillScalar(std::optional<T> &target, const YAML::Node &config, const std::string &key,
                           const std::string &nested_section = "");
    static void fillFlag(bool &target, const YAML::Node &config, const std::string &key,
                         const std::string &nested_section = "");
    static void fillFlag(std::optional<bool> &target, const YAML::Node &config, const std::string &key,
                         const std::string &nested_section = "");
};
