#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Reads and writes the per-batch manifest document
 */
class Manifest
{
public:
    /**
     * @brief Load a manifest
     * @param path Manifest file
     * @param root_key Key of the empty list returned when the file does not exist
     */
    static nlohmann::json load(const std::filesystem::path &path, const std::string &root_key = "photos");

    /**
     * @brief Write a manifest as indented ASCII JSON, creating parent directories
     * @return false if the file could not be written
     */
    static bool save(const std::filesystem::path &path, const nlohmann::json &data);
};
