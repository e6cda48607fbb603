#include "core/config_loader.hpp"
#include "core/media_error.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace
{
    const char *VIDEO_SECTION = "video";

    std::string lowerTrimmed(const std::string &value)
    {
        const auto begin = value.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
            return "";
        const auto end = value.find_last_not_of(" \t\r\n");
        std::string result = value.substr(begin, end - begin + 1);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return result;
    }
}

YAML::Node ConfigLoader::loadFile(const std::string &path)
{
    if (!std::filesystem::exists(path))
    {
        throw ConfigError("Config file not found: " + path);
    }

    YAML::Node config;
    try
    {
        config = YAML::LoadFile(path);
    }
    catch (const YAML::Exception &e)
    {
        throw ConfigError("Cannot parse config file " + path + ": " + e.what());
    }

    if (!config || config.IsNull())
        return YAML::Node(YAML::NodeType::Map);
    if (!config.IsMap())
    {
        throw ConfigError("Config must be a YAML mapping: " + path);
    }
    Logger::info("Configuration loaded from: " + path);
    return config;
}

std::optional<bool> ConfigLoader::coerceBool(const std::string &value)
{
    const std::string normalized = lowerTrimmed(value);
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on")
        return true;
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off")
        return false;
    return std::nullopt;
}

std::optional<bool> ConfigLoader::coerceBool(const YAML::Node &node)
{
    if (!node || !node.IsScalar())
        return std::nullopt;
    return coerceBool(node.Scalar());
}

bool ConfigLoader::isValidPreset(const std::string &preset)
{
    return preset == "youtube16x9" || preset == "shorts9x16" || preset == "clips_only";
}

YAML::Node ConfigLoader::lookup(const YAML::Node &config, const std::string &key, const std::string &nested_section)
{
    if (!config || !config.IsMap())
        return YAML::Node();

    YAML::Node value = config[key];
    if (value && !value.IsNull())
        return value;

    if (!nested_section.empty())
    {
        YAML::Node section = config[nested_section];
        if (section && section.IsMap())
        {
            YAML::Node nested = section[key];
            if (nested && !nested.IsNull())
                return nested;
        }
    }
    return YAML::Node();
}

std::optional<std::string> ConfigLoader::envValue(const char *name)
{
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0')
        return std::nullopt;
    return std::string(value);
}

template <typename T>
void ConfigLoader::fillScalar(std::optional<T> &target, const YAML::Node &config, const std::string &key,
                              const std::string &nested_section)
{
    if (target.has_value())
        return;
    YAML::Node value = lookup(config, key, nested_section);
    if (!value)
        return;
    try
    {
        target = value.as<T>();
    }
    catch (const YAML::Exception &e)
    {
        throw ConfigError("Invalid value for config key '" + key + "': " + e.what());
    }
}

void ConfigLoader::fillFlag(bool &target, const YAML::Node &config, const std::string &key,
                            const std::string &nested_section)
{
    // A flag given on the command line stays set
    if (target)
        return;
    YAML::Node value = lookup(config, key, nested_section);
    if (!value)
        return;
    std::optional<bool> parsed = coerceBool(value);
    if (!parsed)
    {
        throw ConfigError("Invalid boolean for config key '" + key + "'");
    }
    target = *parsed;
}

void ConfigLoader::fillFlag(std::optional<bool> &target, const YAML::Node &config, const std::string &key,
                            const std::string &nested_section)
{
    if (target.has_value())
        return;
    YAML::Node value = lookup(config, key, nested_section);
    if (!value)
        return;
    std::optional<bool> parsed = coerceBool(value);
    if (!parsed)
    {
        throw ConfigError("Invalid boolean for config key '" + key + "'");
    }
    target = parsed;
}

void ConfigLoader::applyPhotoConfig(PhotoOptions &options, const YAML::Node &config)
{
    fillScalar(options.input, config, "input");
    fillScalar(options.output, config, "output");
    fillScalar(options.model, config, "model");
    fillScalar(options.base_url, config, "base_url");
    fillScalar(options.base_url, config, "ollama_base_url");
    fillScalar(options.target_count, config, "target_count");
    fillFlag(options.dedupe, config, "dedupe");
    fillScalar(options.hamming_threshold, config, "hamming_threshold");
    fillFlag(options.resume, config, "resume");
    fillFlag(options.force, config, "force");
}

void ConfigLoader::applyVideoConfig(VideoOptions &options, const YAML::Node &config)
{
    fillScalar(options.input, config, "input", VIDEO_SECTION);
    fillScalar(options.output, config, "output", VIDEO_SECTION);
    fillScalar(options.model, config, "model", VIDEO_SECTION);
    fillScalar(options.base_url, config, "base_url", VIDEO_SECTION);
    fillScalar(options.base_url, config, "ollama_base_url", VIDEO_SECTION);
    fillScalar(options.preset, config, "preset", VIDEO_SECTION);
    fillScalar(options.max_source_seconds, config, "max_source_seconds", VIDEO_SECTION);
    fillScalar(options.min_clip, config, "min_clip", VIDEO_SECTION);
    fillScalar(options.max_clip, config, "max_clip", VIDEO_SECTION);
    fillFlag(options.video_dedupe, config, "video_dedupe", VIDEO_SECTION);
    fillScalar(options.video_dedupe_hamming_threshold, config, "video_dedupe_hamming_threshold", VIDEO_SECTION);
    fillScalar(options.video_dedupe_scope, config, "video_dedupe_scope", VIDEO_SECTION);
    fillScalar(options.video_max_selected_clips, config, "video_max_selected_clips", VIDEO_SECTION);
    fillScalar(options.video_target_digest_seconds, config, "video_target_digest_seconds", VIDEO_SECTION);
    fillFlag(options.use_hwaccel, config, "use_hwaccel", VIDEO_SECTION);
    fillFlag(options.keep_temp, config, "keep_temp", VIDEO_SECTION);
    fillFlag(options.concat_in_digest_folder, config, "concat_in_digest_folder", VIDEO_SECTION);
    fillFlag(options.delete_split_files, config, "delete_split_files", VIDEO_SECTION);
}

PhotoSettings ConfigLoader::resolvePhoto(PhotoOptions options)
{
    if (options.config_path)
        applyPhotoConfig(options, loadFile(*options.config_path));

    if (!options.model)
        options.model = envValue("OLLAMA_MODEL");
    if (!options.base_url)
        options.base_url = envValue("OLLAMA_BASE_URL");

    if (!options.input)
        throw ConfigError("Missing required parameter: input");
    if (!options.output)
        throw ConfigError("Missing required parameter: output");
    if (!options.target_count)
        throw ConfigError("Missing required parameter: target_count");
    if (*options.target_count <= 0)
        throw ConfigError("target_count must be positive");
    if (!options.model && !options.dry_run)
        throw ConfigError("Missing required parameter: model (or set OLLAMA_MODEL)");

    PhotoSettings settings;
    settings.input_dir = *options.input;
    settings.output_dir = *options.output;
    settings.model = options.model.value_or("");
    settings.base_url = options.base_url.value_or(DEFAULT_BASE_URL);
    settings.target_count = *options.target_count;
    settings.resume = options.resume;
    settings.force = options.force;
    settings.dedupe_enabled = options.dedupe.value_or(true);
    settings.hamming_threshold = options.hamming_threshold.value_or(settings.hamming_threshold);
    settings.dry_run = options.dry_run;
    if (settings.hamming_threshold < 0)
        throw ConfigError("hamming_threshold must not be negative");
    return settings;
}

VideoSettings ConfigLoader::resolveVideo(VideoOptions options)
{
    if (options.config_path)
        applyVideoConfig(options, loadFile(*options.config_path));

    if (!options.model)
        options.model = envValue("OLLAMA_MODEL");
    if (!options.base_url)
        options.base_url = envValue("OLLAMA_BASE_URL");

    if (!options.input)
        throw ConfigError("Missing required parameter: input");
    if (!options.output)
        throw ConfigError("Missing required parameter: output");
    if (!options.max_source_seconds)
        throw ConfigError("Missing required parameter: max_source_seconds");
    if (*options.max_source_seconds <= 0)
        throw ConfigError("max_source_seconds must be positive");
    if (!options.model && !options.dry_run)
        throw ConfigError("Missing required parameter: model (or set OLLAMA_MODEL)");

    VideoSettings settings;
    settings.input = *options.input;
    settings.output_dir = *options.output;
    settings.model = options.model.value_or("");
    settings.base_url = options.base_url.value_or(DEFAULT_BASE_URL);
    settings.preset = options.preset.value_or(settings.preset);
    settings.max_source_seconds = *options.max_source_seconds;
    settings.min_clip = options.min_clip.value_or(settings.min_clip);
    settings.max_clip = options.max_clip.value_or(settings.max_clip);
    settings.use_hwaccel = options.use_hwaccel;
    settings.keep_temp = options.keep_temp;
    settings.concat_in_digest_folder = options.concat_in_digest_folder;
    settings.delete_split_files = options.delete_split_files;
    settings.dry_run = options.dry_run;

    if (!isValidPreset(settings.preset))
        throw ConfigError("Unknown preset: " + settings.preset);
    if (settings.min_clip <= 0 || settings.max_clip <= 0)
        throw ConfigError("min_clip and max_clip must be positive");
    if (settings.min_clip > settings.max_clip)
        throw ConfigError("min_clip must not exceed max_clip");

    ClipSelectionOptions &selection = settings.selection;
    selection.max_source_seconds = settings.max_source_seconds;
    selection.dedupe_enabled = options.video_dedupe.value_or(selection.dedupe_enabled);
    selection.hamming_threshold = options.video_dedupe_hamming_threshold.value_or(selection.hamming_threshold);
    selection.max_selected_clips = options.video_max_selected_clips.value_or(selection.max_selected_clips);
    selection.target_digest_seconds = options.video_target_digest_seconds.value_or(selection.target_digest_seconds);
    if (options.video_dedupe_scope)
    {
        std::optional<DedupeScope> scope = dedupeScopeFromString(*options.video_dedupe_scope);
        if (!scope)
            throw ConfigError("Unknown video dedupe scope: " + *options.video_dedupe_scope);
        selection.scope = *scope;
    }
    if (selection.hamming_threshold < 0)
        throw ConfigError("video_dedupe_hamming_threshold must not be negative");
    return settings;
}
