#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/job_state.hpp"

namespace fs = std::filesystem;

/**
 * @brief What a cleanup call is asked to remove
 */
struct CleanupRequest
{
    fs::path output_dir;             // Declared output root; targets must live under it
    fs::path temp_dir;               // Working directory, expected to be named "temp"
    fs::path clip_dir;               // Split clips, expected to be "<temp_dir>/clips"
    bool keep_temp = false;          // Keep every working artifact
    bool delete_split_files = false; // With keep_temp, still clear the split clips
};

/**
 * @brief Every decision and deletion made by one cleanup call
 */
struct CleanupReport
{
    enum class Status
    {
        DELETED, // Everything under the target was removed
        PARTIAL, // Some files or directories could not be removed
        SKIPPED  // Nothing was touched
    };

    Status status = Status::SKIPPED;
    std::string reason;
    std::string target;
    std::vector<std::string> deleted_files;
    std::vector<std::pair<std::string, std::string>> failed_files;
    std::vector<std::string> removed_dirs;
    std::vector<std::pair<std::string, std::string>> failed_dirs;

    nlohmann::json toJson() const;
};

/**
 * @brief Guarded deletion of working directories after a failure-free batch
 */
class TempCleanup
{
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;
    // Same contract as fs::remove(path, ec)
    using RemoveFunction = std::function<bool(const fs::path &, std::error_code &)>;

    static constexpr int MAX_ATTEMPTS = 3;
    static constexpr int RETRY_BACKOFF_MS = 200;

    explicit TempCleanup(SleepFunction sleep = nullptr, RemoveFunction remove = nullptr);

    /**
     * @brief Remove working artifacts if the batch allows it
     *
     * Nothing is touched unless the outcome is failure-free and the target passes
     * the containment check. Files go first, then directories deepest-first, each
     * only when empty.
     */
    CleanupReport cleanupTempArtifacts(const CleanupRequest &request, const JobOutcome &outcome) const;

    /**
     * @brief Containment check for a deletion target
     * @param target Directory to delete
     * @param sentinel Required final path component of the canonical target
     * @param root Directory the canonical target must be strictly nested under
     * @param reason Filled with the refusal reason
     */
    static bool isSafeTarget(const fs::path &target, const std::string &sentinel, const fs::path &root,
                             std::string &reason);

private:
    SleepFunction sleep_;
    RemoveFunction remove_;

    bool removeFileWithRetry(const fs::path &path, std::string &error) const;
    bool removeDirWithRetry(const fs::path &path, std::string &error) const;
    void removeTree(const fs::path &target, CleanupReport &report) const;
};
