#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class JobStep
{
    SPLIT,
    SCORE,
    SELECT,
    CONCAT
};

enum class StepStatus
{
    OK,
    FAILED
};

struct StepEntry
{
    StepStatus status = StepStatus::OK;
    std::optional<std::string> error;
};

/**
 * @brief Append-only ledger of per-step, per-item outcomes for one batch
 *
 * Each (step, key) pair can be written once; later writes are refused.
 */
class JobState
{
public:
    static std::string stepName(JobStep step);
    static std::vector<JobStep> allSteps();

    /**
     * @brief Record an outcome
     * @return false if the pair was already recorded
     */
    bool record(JobStep step, const std::string &key, StepStatus status,
                const std::optional<std::string> &error = std::nullopt);
    bool recordOk(JobStep step, const std::string &key);
    bool recordFailed(JobStep step, const std::string &key, const std::string &error);

    std::optional<StepEntry> entry(JobStep step, const std::string &key) const;
    size_t failedCount() const;
    size_t entryCount() const;
    bool hasFailures() const { return failedCount() > 0; }

    nlohmann::json toJson() const;

private:
    mutable std::mutex mutex_;
    std::map<JobStep, std::map<std::string, StepEntry>> steps_;
};

/**
 * @brief Aggregate view of a finished batch used to gate destructive actions
 */
struct JobOutcome
{
    size_t failed_entries = 0;
    size_t item_errors = 0;

    bool isFailureFree() const { return failed_entries == 0 && item_errors == 0; }

    /**
     * @param ledger Job state of the batch
     * @param errors Error slot of every item/source in the batch
     */
    static JobOutcome compute(const JobState &ledger, const std::vector<std::optional<std::string>> &errors);
};
