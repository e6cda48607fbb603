#include "core/job_state.hpp"
#include "logging/logger.hpp"

using json = nlohmann::json;

std::string JobState::stepName(JobStep step)
{
    switch (step)
    {
    case JobStep::SPLIT:
        return "split";
    case JobStep::SCORE:
        return "score";
    case JobStep::SELECT:
        return "select";
    case JobStep::CONCAT:
        return "concat";
    }
    return "unknown";
}

std::vector<JobStep> JobState::allSteps()
{
    return {JobStep::SPLIT, JobStep::SCORE, JobStep::SELECT, JobStep::CONCAT};
}

bool JobState::record(JobStep step, const std::string &key, StepStatus status,
                      const std::optional<std::string> &error)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto &entries = steps_[step];
    if (entries.count(key) > 0)
    {
        Logger::warn("Job state for " + stepName(step) + "/" + key + " already recorded, ignoring update");
        return false;
    }
    entries[key] = StepEntry{status, error};
    return true;
}

bool JobState::recordOk(JobStep step, const std::string &key)
{
    return record(step, key, StepStatus::OK);
}

bool JobState::recordFailed(JobStep step, const std::string &key, const std::string &error)
{
    return record(step, key, StepStatus::FAILED, error);
}

std::optional<StepEntry> JobState::entry(JobStep step, const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto step_it = steps_.find(step);
    if (step_it == steps_.end())
        return std::nullopt;
    auto it = step_it->second.find(key);
    if (it == step_it->second.end())
        return std::nullopt;
    return it->second;
}

size_t JobState::failedCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t failed = 0;
    for (const auto &step : steps_)
    {
        for (const auto &item : step.second)
        {
            if (item.second.status == StepStatus::FAILED)
                failed++;
        }
    }
    return failed;
}

size_t JobState::entryCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto &step : steps_)
        count += step.second.size();
    return count;
}

json JobState::toJson() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    json result = json::object();
    for (JobStep step : allSteps())
    {
        json entries = json::object();
        auto step_it = steps_.find(step);
        if (step_it != steps_.end())
        {
            for (const auto &item : step_it->second)
            {
                json value = {{"status", item.second.status == StepStatus::OK ? "ok" : "failed"}};
                if (item.second.error)
                    value["error"] = *item.second.error;
                entries[item.first] = value;
            }
        }
        result[stepName(step)] = entries;
    }
    return result;
}

JobOutcome JobOutcome::compute(const JobState &ledger, const std::vector<std::optional<std::string>> &errors)
{
    JobOutcome outcome;
    outcome.failed_entries = ledger.failedCount();
    for (const auto &error : errors)
    {
        if (error && !error->empty())
            outcome.item_errors++;
    }
    return outcome;
}
