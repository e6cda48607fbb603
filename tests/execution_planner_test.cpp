#include "test_base.hpp"
#include <algorithm>
#include "core/execution_planner.hpp"
#include "core/fingerprint.hpp"
#include "core/output_paths.hpp"
#include "core/score_cache.hpp"

class ExecutionPlannerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        input_dir_ = scratchDir() / "input";
        output_dir_ = scratchDir() / "output";
        image_path_ = writeImage("input/photo.jpg", cv::Mat(10, 10, CV_8UC3, cv::Scalar(0, 0, 255)));
    }

    static bool contains(const std::vector<std::string> &items, const std::string &value)
    {
        return std::find(items.begin(), items.end(), value) != items.end();
    }

    fs::path input_dir_;
    fs::path output_dir_;
    fs::path image_path_;
};

TEST_F(ExecutionPlannerTest, ResumeSkipsCached)
{
    PhotoOutputPaths paths = OutputPaths::photo(output_dir_);
    fs::create_directories(paths.scores_dir);
    {
        ScoreCache cache(paths.db_path.string());
        const std::string hex = Fingerprint::toHex(Fingerprint::fromFile(image_path_.string()));
        ASSERT_TRUE(cache.upsert(image_path_.string(), hex, 0.5, nlohmann::json{{"score", 0.5}},
                                 nlohmann::json::object())
                        .success);
    }

    ExecutionPlan plan = ExecutionPlanner::photoPlan(input_dir_, output_dir_, true, false);

    EXPECT_TRUE(plan.files_to_process.empty());
    EXPECT_EQ(plan.files_to_skip, std::vector<std::string>{image_path_.string()});
    EXPECT_TRUE(plan.toJson()["resume"].get<bool>());

    // force disables resume
    ExecutionPlan forced = ExecutionPlanner::photoPlan(input_dir_, output_dir_, true, true);
    EXPECT_EQ(forced.files_to_process, std::vector<std::string>{image_path_.string()});
    EXPECT_FALSE(forced.resume);
}

TEST_F(ExecutionPlannerTest, WithoutResumeProcessesAll)
{
    ExecutionPlan plan = ExecutionPlanner::photoPlan(input_dir_, output_dir_, false, false);

    EXPECT_EQ(plan.files_to_process, std::vector<std::string>{image_path_.string()});
    EXPECT_TRUE(plan.files_to_skip.empty());
    EXPECT_TRUE(contains(plan.estimated_output_paths, (output_dir_ / "selected" / "photo.jpg").string()));
    EXPECT_TRUE(contains(plan.estimated_output_paths, (output_dir_ / "scores" / "manifest.photos.json").string()));
}

TEST_F(ExecutionPlannerTest, PlanningNeverCreatesOutputs)
{
    ExecutionPlanner::photoPlan(input_dir_, output_dir_, true, false);
    EXPECT_FALSE(fs::exists(output_dir_));
}

TEST_F(ExecutionPlannerTest, VideoPlanListsDigestOutputs)
{
    writeFile("videos/trip.mp4", "video");
    writeFile("videos/notes.txt", "text");

    ExecutionPlan plan = ExecutionPlanner::videoPlan(scratchDir() / "videos", output_dir_, "youtube16x9", true);

    EXPECT_EQ(plan.files_to_process, std::vector<std::string>{(scratchDir() / "videos" / "trip.mp4").string()});
    const auto &outputs = plan.estimated_output_paths;
    EXPECT_TRUE(contains(outputs, (output_dir_ / "digest_clips" / "trip" / "clip_*.mp4").string()));
    EXPECT_TRUE(contains(outputs, (output_dir_ / "trip_digest.mp4").string()));
    EXPECT_TRUE(contains(outputs, (output_dir_ / "temp" / "concat" / "trip_root.txt").string()));
    EXPECT_TRUE(contains(outputs, (output_dir_ / "digest_clips" / "trip" / "digest.mp4").string()));
    EXPECT_TRUE(contains(outputs, (output_dir_ / "temp" / "concat" / "trip_folder.txt").string()));

    nlohmann::json json = plan.toJson();
    EXPECT_EQ(json["preset"], "youtube16x9");
    EXPECT_TRUE(json["concat_in_digest_folder"].get<bool>());
    EXPECT_FALSE(json.contains("resume"));
}

TEST_F(ExecutionPlannerTest, VideoPlanMatchesRunLabelsForSharedStems)
{
    writeFile("videos/day1/trip.mp4", "video");
    writeFile("videos/day2/trip.mp4", "video");

    ExecutionPlan plan = ExecutionPlanner::videoPlan(scratchDir() / "videos", output_dir_, "youtube16x9", false);

    ASSERT_EQ(plan.files_to_process.size(), 2u);
    EXPECT_TRUE(contains(plan.estimated_output_paths, (output_dir_ / "trip_digest.mp4").string()));
    EXPECT_TRUE(contains(plan.estimated_output_paths, (output_dir_ / "trip_2_digest.mp4").string()));
    EXPECT_TRUE(contains(plan.estimated_output_paths, (output_dir_ / "digest_clips" / "trip_2" / "clip_*.mp4").string()));
}

TEST_F(ExecutionPlannerTest, ClipsOnlyPlanHasNoDigest)
{
    fs::path video = writeFile("trip.mov", "video");

    ExecutionPlan plan = ExecutionPlanner::videoPlan(video, output_dir_, "clips_only", false);

    EXPECT_EQ(plan.files_to_process, std::vector<std::string>{video.string()});
    EXPECT_FALSE(contains(plan.estimated_output_paths, (output_dir_ / "trip_digest.mp4").string()));
    EXPECT_TRUE(contains(plan.estimated_output_paths, (output_dir_ / "digest_clips" / "trip" / "clip_*.mp4").string()));
}

TEST(ExecutionPlannerDedupeTest, PreservesFirstSeenOrder)
{
    EXPECT_EQ(ExecutionPlanner::dedupePreservingOrder({"b", "a", "b", "c", "a"}),
              (std::vector<std::string>{"b", "a", "c"}));
}
