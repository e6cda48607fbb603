#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>

const std::set<std::string> &FileUtils::imageExtensions()
{
    static const std::set<std::string> extensions = {".jpg", ".jpeg", ".png", ".heic"};
    return extensions;
}

const std::set<std::string> &FileUtils::videoExtensions()
{
    static const std::set<std::string> extensions = {".mp4", ".mov", ".mkv", ".avi", ".webm"};
    return extensions;
}

bool FileUtils::hasExtension(const fs::path &path, const std::set<std::string> &extensions)
{
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return extensions.count(extension) > 0;
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_directory(path, ec);
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext)
{
    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        try
        {
            for (const auto &entry : fs::directory_iterator(current_path))
            {
                try
                {
                    if (entry.is_regular_file())
                    {
                        onNext(entry.path().string());
                    }
                    else if (entry.is_directory())
                    {
                        scanDirectory(entry.path());
                    }
                }
                catch (const fs::filesystem_error &e)
                {
                    Logger::warn("Skipping entry due to permission error: " + entry.path().string() + " - " + e.what());
                    continue;
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            // Log the error but don't stop the entire scan
            Logger::warn("Error accessing directory " + current_path.string() + ": " + e.what());
        }
    };
    scanDirectory(fs::path(dir_path));
}

std::vector<fs::path> FileUtils::collectWithExtensions(const fs::path &input_dir,
                                                       const std::set<std::string> &extensions)
{
    std::vector<fs::path> paths;
    if (!isValidDirectory(input_dir.string()))
    {
        Logger::warn("Invalid directory path: " + input_dir.string());
        return paths;
    }

    scanDirectoryRecursively(input_dir.string(), [&](const std::string &file_path)
                             {
                                 if (hasExtension(file_path, extensions))
                                     paths.emplace_back(file_path);
                             });
    std::sort(paths.begin(), paths.end());
    return paths;
}

std::vector<fs::path> FileUtils::collectImagePaths(const fs::path &input_dir)
{
    return collectWithExtensions(input_dir, imageExtensions());
}

std::vector<fs::path> FileUtils::collectVideoPaths(const fs::path &input)
{
    std::error_code ec;
    if (fs::is_regular_file(input, ec))
    {
        if (hasExtension(input, videoExtensions()))
            return {input};
        return {};
    }
    return collectWithExtensions(input, videoExtensions());
}

bool FileUtils::copyFile(const fs::path &source, const fs::path &destination, std::string &error)
{
    std::error_code ec;
    if (!destination.parent_path().empty())
    {
        fs::create_directories(destination.parent_path(), ec);
        if (ec)
        {
            error = "Cannot create directory " + destination.parent_path().string() + ": " + ec.message();
            return false;
        }
    }
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        error = "Cannot copy " + source.string() + " to " + destination.string() + ": " + ec.message();
        return false;
    }
    return true;
}
