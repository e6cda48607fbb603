#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

/**
 * @brief What a batch would do, computed without side effects
 */
struct ExecutionPlan
{
    std::string type; // "photo" or "video"
    bool resume = false;
    std::optional<std::string> preset;
    bool concat_in_digest_folder = false;
    std::vector<std::string> files_to_process;
    std::vector<std::string> files_to_skip;
    std::vector<std::string> estimated_output_paths; // First-seen order, no duplicates

    nlohmann::json toJson() const;
};

/**
 * @brief Dry-run planning for photo and video batches
 *
 * Never writes to the cache or the output directory; the cache is opened
 * read-only and a missing cache file behaves as empty.
 */
class ExecutionPlanner
{
public:
    static ExecutionPlan photoPlan(const fs::path &input_dir, const fs::path &output_dir, bool resume, bool force);

    static ExecutionPlan videoPlan(const fs::path &input, const fs::path &output_dir, const std::string &preset,
                                   bool concat_in_digest_folder);

    static std::vector<std::string> dedupePreservingOrder(const std::vector<std::string> &items);
};
