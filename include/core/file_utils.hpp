#pragma once

#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief File utilities for input discovery and output copies
 */
class FileUtils
{
public:
    static const std::set<std::string> &imageExtensions();
    static const std::set<std::string> &videoExtensions();

    /**
     * @brief Case-insensitive extension check
     * @param extensions Lowercase extensions including the dot
     */
    static bool hasExtension(const fs::path &path, const std::set<std::string> &extensions);

    /**
     * Scans a directory recursively and calls the provided function for each file.
     * Unreadable entries and directories are logged and skipped.
     * @param dir_path Directory path to scan
     * @param onNext Function to call for each file found
     */
    static void scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext);

    /**
     * @brief Supported photos under a directory, recursively, sorted by path
     */
    static std::vector<fs::path> collectImagePaths(const fs::path &input_dir);

    /**
     * @brief Supported videos: the input itself if it is a video file, else a recursive scan
     */
    static std::vector<fs::path> collectVideoPaths(const fs::path &input);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Copy a file, overwriting the destination and creating its parent directory
     * @return false with error filled when the copy failed
     */
    static bool copyFile(const fs::path &source, const fs::path &destination, std::string &error);

private:
    static std::vector<fs::path> collectWithExtensions(const fs::path &input_dir,
                                                       const std::set<std::string> &extensions);
};
