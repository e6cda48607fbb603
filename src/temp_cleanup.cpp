#include "core/temp_cleanup.hpp"
#include "core/media_error.hpp"
#include "core/output_paths.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <thread>

using json = nlohmann::json;

namespace
{
    bool isNestedUnder(const fs::path &child, const fs::path &parent)
    {
        auto child_it = child.begin();
        for (auto parent_it = parent.begin(); parent_it != parent.end(); ++parent_it, ++child_it)
        {
            // A trailing empty component comes from a trailing separator
            if (parent_it->empty())
                continue;
            if (child_it == child.end() || *child_it != *parent_it)
                return false;
        }
        return child_it != child.end();
    }

    size_t depthOf(const fs::path &path)
    {
        return static_cast<size_t>(std::distance(path.begin(), path.end()));
    }
}

json CleanupReport::toJson() const
{
    auto pairs = [](const std::vector<std::pair<std::string, std::string>> &items)
    {
        json result = json::array();
        for (const auto &item : items)
            result.push_back({{"path", item.first}, {"error", item.second}});
        return result;
    };

    std::string status_name = "skipped";
    if (status == Status::DELETED)
        status_name = "deleted";
    else if (status == Status::PARTIAL)
        status_name = "partial";

    return json{
        {"status", status_name},
        {"reason", reason},
        {"target", target},
        {"deleted_files", deleted_files},
        {"failed_files", pairs(failed_files)},
        {"removed_dirs", removed_dirs},
        {"failed_dirs", pairs(failed_dirs)}};
}

TempCleanup::TempCleanup(SleepFunction sleep, RemoveFunction remove)
    : sleep_(std::move(sleep)), remove_(std::move(remove))
{
    if (!sleep_)
    {
        sleep_ = [](std::chrono::milliseconds delay)
        { std::this_thread::sleep_for(delay); };
    }
    if (!remove_)
    {
        remove_ = [](const fs::path &path, std::error_code &ec)
        { return fs::remove(path, ec); };
    }
}

bool TempCleanup::isSafeTarget(const fs::path &target, const std::string &sentinel, const fs::path &root,
                               std::string &reason)
{
    std::error_code ec;
    fs::path canonical_target = fs::weakly_canonical(target, ec);
    if (ec)
    {
        reason = "cannot resolve " + target.string() + ": " + ec.message();
        return false;
    }
    fs::path canonical_root = fs::weakly_canonical(root, ec);
    if (ec)
    {
        reason = "cannot resolve " + root.string() + ": " + ec.message();
        return false;
    }

    fs::path name = canonical_target.filename();
    if (name.empty())
        name = canonical_target.parent_path().filename();
    if (name != sentinel)
    {
        reason = canonical_target.string() + " is not named '" + sentinel + "'";
        return false;
    }
    if (!isNestedUnder(canonical_target, canonical_root))
    {
        reason = canonical_target.string() + " is not inside " + canonical_root.string();
        return false;
    }
    return true;
}

bool TempCleanup::removeFileWithRetry(const fs::path &path, std::string &error) const
{
    for (int attempt = 1; attempt <= MAX_ATTEMPTS; ++attempt)
    {
        std::error_code ec;
        remove_(path, ec);
        // remove() reports no error when the file is already gone
        if (!ec)
            return true;

        error = ec.message();
        if (attempt < MAX_ATTEMPTS)
        {
            Logger::warn("Failed to delete " + path.string() + ", retrying in " + std::to_string(RETRY_BACKOFF_MS) +
                         "ms (attempt " + std::to_string(attempt) + "/" + std::to_string(MAX_ATTEMPTS) + "): " + error);
            sleep_(std::chrono::milliseconds(RETRY_BACKOFF_MS));
        }
    }
    return false;
}

bool TempCleanup::removeDirWithRetry(const fs::path &path, std::string &error) const
{
    for (int attempt = 1; attempt <= MAX_ATTEMPTS; ++attempt)
    {
        std::error_code ec;
        if (!fs::exists(path, ec))
            return true;

        bool empty = fs::is_empty(path, ec);
        if (!ec && !empty)
        {
            error = "directory not empty";
            return false;
        }
        if (!ec)
        {
            remove_(path, ec);
            if (!ec)
                return true;
        }

        error = ec.message();
        if (attempt < MAX_ATTEMPTS)
        {
            Logger::warn("Failed to remove directory " + path.string() + ", retrying in " +
                         std::to_string(RETRY_BACKOFF_MS) + "ms (attempt " + std::to_string(attempt) + "/" +
                         std::to_string(MAX_ATTEMPTS) + "): " + error);
            sleep_(std::chrono::milliseconds(RETRY_BACKOFF_MS));
        }
    }
    return false;
}

void TempCleanup::removeTree(const fs::path &target, CleanupReport &report) const
{
    std::vector<fs::path> files;
    std::vector<fs::path> dirs;

    std::error_code ec;
    for (fs::recursive_directory_iterator it(target, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec))
    {
        fs::file_status status = it->symlink_status(ec);
        if (ec)
            break;
        if (fs::is_directory(status))
            dirs.push_back(it->path());
        else
            files.push_back(it->path());
    }
    if (ec)
    {
        report.failed_dirs.emplace_back(target.string(), "listing failed: " + ec.message());
        Logger::error("Failed to list " + target.string() + ": " + ec.message());
    }

    for (const auto &file : files)
    {
        std::string error;
        if (removeFileWithRetry(file, error))
        {
            report.deleted_files.push_back(file.string());
        }
        else
        {
            report.failed_files.emplace_back(file.string(), error);
            Logger::error("Failed to delete " + file.string() + ": " + error);
        }
    }

    std::stable_sort(dirs.begin(), dirs.end(), [](const fs::path &left, const fs::path &right)
                     { return depthOf(left) > depthOf(right); });
    dirs.push_back(target);

    for (const auto &dir : dirs)
    {
        std::string error;
        if (removeDirWithRetry(dir, error))
        {
            report.removed_dirs.push_back(dir.string());
        }
        else
        {
            report.failed_dirs.emplace_back(dir.string(), error);
            Logger::warn("Directory left in place " + dir.string() + ": " + error);
        }
    }
}

CleanupReport TempCleanup::cleanupTempArtifacts(const CleanupRequest &request, const JobOutcome &outcome) const
{
    CleanupReport report;

    fs::path target;
    fs::path root;
    std::string sentinel;
    if (!request.keep_temp)
    {
        target = request.temp_dir;
        root = request.output_dir;
        sentinel = OutputPaths::TEMP_DIR_NAME;
    }
    else if (request.delete_split_files)
    {
        target = request.clip_dir;
        root = request.temp_dir;
        sentinel = OutputPaths::CLIPS_DIR_NAME;
    }
    else
    {
        report.reason = "keep_temp requested";
        Logger::info("Cleanup skipped: " + report.reason);
        return report;
    }
    report.target = target.string();

    if (!outcome.isFailureFree())
    {
        report.reason = "batch has " + std::to_string(outcome.failed_entries) + " failed step(s) and " +
                        std::to_string(outcome.item_errors) + " item error(s)";
        Logger::warn("Cleanup skipped for " + report.target + ": " + report.reason);
        return report;
    }

    std::string reason;
    if (!isSafeTarget(target, sentinel, root, reason))
    {
        report.reason = MediaError::kindName(MediaErrorKind::UNSAFE_CLEANUP_TARGET) + ": " + reason;
        Logger::error("Cleanup refused: " + report.reason);
        return report;
    }
    // The split clip directory is only safe when its temp root is
    if (request.keep_temp && !isSafeTarget(request.temp_dir, OutputPaths::TEMP_DIR_NAME, request.output_dir, reason))
    {
        report.reason = MediaError::kindName(MediaErrorKind::UNSAFE_CLEANUP_TARGET) + ": " + reason;
        Logger::error("Cleanup refused: " + report.reason);
        return report;
    }

    std::error_code ec;
    if (!fs::exists(target, ec))
    {
        report.reason = "nothing to clean";
        Logger::info("Cleanup skipped, target does not exist: " + report.target);
        return report;
    }

    removeTree(target, report);

    if (report.failed_files.empty() && report.failed_dirs.empty())
    {
        report.status = CleanupReport::Status::DELETED;
        report.reason = "batch completed without failures";
    }
    else
    {
        report.status = CleanupReport::Status::PARTIAL;
        report.reason = std::to_string(report.failed_files.size()) + " file(s) and " +
                        std::to_string(report.failed_dirs.size()) + " directory(ies) could not be removed";
    }

    Logger::info("Cleanup of " + report.target + ": " + std::to_string(report.deleted_files.size()) +
                 " file(s) deleted, " + std::to_string(report.removed_dirs.size()) + " directory(ies) removed, " +
                 std::to_string(report.failed_files.size() + report.failed_dirs.size()) + " failure(s)");
    return report;
}
