#include "test_base.hpp"
#include "core/manifest.hpp"
#include "core/output_paths.hpp"
#include "core/photo_pipeline.hpp"
#include "test_fakes.hpp"

class PhotoPipelineTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        writeImage("input/a.png", splitImage(64, 64));
        writeImage("input/b.png", verticalSplitImage(64, 64));
        writeImage("input/nested/c.png", checkerboard(64, 64, 8));

        transport_ = std::make_shared<FakeJudgeTransport>();
        transport_->fallback = FakeJudgeTransport::reply("{\"score\": 0.6, \"caption\": \"test\"}");
        judge_ = std::make_unique<JudgeClient>(transport_, JudgeClient::Settings{},
                                               [](std::chrono::milliseconds) {});
    }

    PhotoSettings settings(int target_count) const
    {
        PhotoSettings result;
        result.input_dir = (scratchDir() / "input").string();
        result.output_dir = (scratchDir() / "output").string();
        result.model = "llava";
        result.base_url = "http://localhost:11434";
        result.target_count = target_count;
        return result;
    }

    std::shared_ptr<FakeJudgeTransport> transport_;
    std::unique_ptr<JudgeClient> judge_;
};

TEST_F(PhotoPipelineTest, ScoresSelectsAndCopies)
{
    PhotoPipeline pipeline(settings(2), *judge_);
    PhotoBatchResult result = pipeline.run();

    EXPECT_EQ(result.items.size(), 3u);
    EXPECT_EQ(result.processed, 3u);
    EXPECT_EQ(result.failed, 0u);
    EXPECT_EQ(result.selected, 2u);
    EXPECT_EQ(transport_->posted_bodies.size(), 3u);

    PhotoOutputPaths paths = OutputPaths::photo(scratchDir() / "output");
    size_t copied = 0;
    for (const auto &item : result.items)
    {
        ASSERT_TRUE(item.final_score.has_value()) << item.path;
        ASSERT_TRUE(item.fingerprint.has_value());
        EXPECT_EQ(item.orientation, "square");
        const bool exists = fs::exists(paths.selected_dir / fs::path(item.path).filename());
        EXPECT_EQ(exists, item.selected) << item.path;
        copied += exists ? 1 : 0;
    }
    EXPECT_EQ(copied, 2u);

    ASSERT_TRUE(result.manifest_written);
    nlohmann::json manifest = Manifest::load(paths.manifest_path);
    EXPECT_EQ(manifest["photos"].size(), 3u);
    EXPECT_EQ(manifest["target_count"], 2);
    EXPECT_EQ(manifest["model"], "llava");
    EXPECT_TRUE(fs::exists(paths.db_path));
}

TEST_F(PhotoPipelineTest, ResumeUsesCacheWithoutCallingJudge)
{
    PhotoBatchResult first = PhotoPipeline(settings(3), *judge_).run();
    ASSERT_EQ(first.processed, 3u);

    transport_->posted_bodies.clear();
    transport_->fallback = FakeJudgeTransport::connectionError();

    PhotoSettings resumed = settings(3);
    resumed.resume = true;
    PhotoBatchResult second = PhotoPipeline(resumed, *judge_).run();

    EXPECT_TRUE(transport_->posted_bodies.empty());
    EXPECT_EQ(second.skipped, 3u);
    EXPECT_EQ(second.processed, 0u);
    EXPECT_EQ(second.failed, 0u);
    for (size_t i = 0; i < second.items.size(); ++i)
    {
        EXPECT_TRUE(second.items[i].from_cache);
        ASSERT_TRUE(second.items[i].final_score.has_value());
        EXPECT_DOUBLE_EQ(*second.items[i].final_score, *first.items[i].final_score);
    }
}

TEST_F(PhotoPipelineTest, ForceIgnoresCache)
{
    PhotoPipeline(settings(1), *judge_).run();
    transport_->posted_bodies.clear();

    PhotoSettings forced = settings(1);
    forced.resume = true;
    forced.force = true;
    PhotoBatchResult result = PhotoPipeline(forced, *judge_).run();

    EXPECT_EQ(result.processed, 3u);
    EXPECT_EQ(transport_->posted_bodies.size(), 3u);
}

TEST_F(PhotoPipelineTest, ItemFailuresDoNotStopBatch)
{
    writeFile("input/broken.jpg", "not an image");
    transport_->responses.push_back(FakeJudgeTransport::reply("{\"score\": 0.9}"));
    transport_->responses.push_back(FakeJudgeTransport::reply("Sorry, no JSON today"));
    transport_->fallback = FakeJudgeTransport::connectionError();

    PhotoBatchResult result = PhotoPipeline(settings(5), *judge_).run();

    ASSERT_EQ(result.items.size(), 4u);
    EXPECT_EQ(result.processed, 1u);
    EXPECT_EQ(result.failed, 3u);
    EXPECT_EQ(result.selected, 1u);

    // Items are sorted by path: a.png, b.png, broken.jpg, nested/c.png
    EXPECT_FALSE(result.items[0].error.has_value());
    EXPECT_TRUE(result.items[0].selected);
    ASSERT_TRUE(result.items[1].error.has_value());
    EXPECT_NE(result.items[1].error->find("InvalidJudgeResponse"), std::string::npos);
    ASSERT_TRUE(result.items[2].error.has_value());
    EXPECT_NE(result.items[2].error->find("DecodeFailure"), std::string::npos);
    ASSERT_TRUE(result.items[3].error.has_value());
    EXPECT_NE(result.items[3].error->find("JudgeUnavailable"), std::string::npos);
    EXPECT_FALSE(result.items[3].final_score.has_value());
    EXPECT_TRUE(result.manifest_written);
}

TEST_F(PhotoPipelineTest, NearDuplicatesAreNotBothSelected)
{
    writeImage("input/a_copy.png", splitImage(128, 128));

    PhotoBatchResult result = PhotoPipeline(settings(4), *judge_).run();

    EXPECT_EQ(result.processed, 4u);
    EXPECT_EQ(result.selected, 3u);
    size_t split_selected = 0;
    for (const auto &item : result.items)
    {
        const std::string name = fs::path(item.path).filename().string();
        if ((name == "a.png" || name == "a_copy.png") && item.selected)
            split_selected++;
    }
    EXPECT_EQ(split_selected, 1u);
}

TEST_F(PhotoPipelineTest, AnalyzePixelsFillsMetrics)
{
    fs::path wide = writeImage("wide.png", solidImage(80, 40, 128));
    std::vector<MediaItem> items = PhotoPipeline::analyzePixels({wide, scratchDir() / "missing.png"});

    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].width, 80);
    EXPECT_EQ(items[0].height, 40);
    EXPECT_EQ(items[0].orientation, "landscape");
    ASSERT_TRUE(items[0].quality.has_value());
    EXPECT_NEAR(items[0].quality->brightness, 128.0, 1.0);
    EXPECT_TRUE(items[1].error.has_value());
}
