#include "core/manifest.hpp"
#include "logging/logger.hpp"
#include <fstream>

using json = nlohmann::json;

json Manifest::load(const std::filesystem::path &path, const std::string &root_key)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        return json{{root_key, json::array()}};
    }

    std::ifstream file(path);
    if (!file.is_open())
    {
        Logger::warn("Could not open manifest: " + path.string());
        return json{{root_key, json::array()}};
    }

    try
    {
        return json::parse(file);
    }
    catch (const json::parse_error &e)
    {
        Logger::warn("Manifest is not valid JSON, starting fresh: " + path.string() + ": " + e.what());
        return json{{root_key, json::array()}};
    }
}

bool Manifest::save(const std::filesystem::path &path, const json &data)
{
    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
    {
        Logger::error("Failed to create manifest directory " + path.parent_path().string() + ": " + ec.message());
        return false;
    }

    std::ofstream file(path);
    if (!file.is_open())
    {
        Logger::error("Failed to write manifest: " + path.string());
        return false;
    }
    file << data.dump(2, ' ', true);
    file.close();
    if (file.fail())
    {
        Logger::error("Failed to flush manifest: " + path.string());
        return false;
    }

    Logger::info("Manifest saved to: " + path.string());
    return true;
}
