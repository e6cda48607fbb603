#include <gtest/gtest.h>
#include "core/job_state.hpp"

TEST(JobStateTest, EntriesAreWriteOnce)
{
    JobState state;
    EXPECT_TRUE(state.recordOk(JobStep::SPLIT, "a.mp4"));
    EXPECT_FALSE(state.recordFailed(JobStep::SPLIT, "a.mp4", "late failure"));

    auto entry = state.entry(JobStep::SPLIT, "a.mp4");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->status, StepStatus::OK);
    EXPECT_FALSE(entry->error.has_value());
    EXPECT_EQ(state.entryCount(), 1u);

    // Same key under another step is a separate entry
    EXPECT_TRUE(state.recordFailed(JobStep::CONCAT, "a.mp4", "TranscodeFailure: exit 1"));
    EXPECT_EQ(state.failedCount(), 1u);
    EXPECT_TRUE(state.hasFailures());
}

TEST(JobStateTest, MissingEntry)
{
    JobState state;
    EXPECT_FALSE(state.entry(JobStep::SCORE, "nothing").has_value());
    EXPECT_FALSE(state.hasFailures());
}

TEST(JobStateTest, JsonListsEveryStep)
{
    JobState state;
    state.recordOk(JobStep::SCORE, "clip_0000.mp4");
    state.recordFailed(JobStep::SELECT, "a.mp4", "boom");

    nlohmann::json json = state.toJson();
    for (const char *step : {"split", "score", "select", "concat"})
        EXPECT_TRUE(json.contains(step)) << step;
    EXPECT_TRUE(json["split"].empty());
    EXPECT_EQ(json["score"]["clip_0000.mp4"]["status"], "ok");
    EXPECT_FALSE(json["score"]["clip_0000.mp4"].contains("error"));
    EXPECT_EQ(json["select"]["a.mp4"]["status"], "failed");
    EXPECT_EQ(json["select"]["a.mp4"]["error"], "boom");
}

TEST(JobStateTest, OutcomeCountsLedgerFailuresAndItemErrors)
{
    JobState state;
    state.recordOk(JobStep::SPLIT, "a.mp4");
    EXPECT_TRUE(JobOutcome::compute(state, {std::nullopt, std::string()}).isFailureFree());

    JobOutcome with_item_error = JobOutcome::compute(state, {std::nullopt, std::string("DecodeFailure: x")});
    EXPECT_EQ(with_item_error.item_errors, 1u);
    EXPECT_FALSE(with_item_error.isFailureFree());

    state.recordFailed(JobStep::CONCAT, "a.mp4", "TranscodeFailure");
    JobOutcome with_step_failure = JobOutcome::compute(state, {});
    EXPECT_EQ(with_step_failure.failed_entries, 1u);
    EXPECT_FALSE(with_step_failure.isFailureFree());
}
