#include <gtest/gtest.h>
#include "core/output_paths.hpp"

TEST(OutputPathsTest, PhotoLayout)
{
    PhotoOutputPaths paths = OutputPaths::photo("/data/out");
    EXPECT_EQ(paths.selected_dir, fs::path("/data/out/selected"));
    EXPECT_EQ(paths.scores_dir, fs::path("/data/out/scores"));
    EXPECT_EQ(paths.manifest_path, fs::path("/data/out/scores/manifest.photos.json"));
    EXPECT_EQ(paths.db_path, fs::path("/data/out/scores/photo_scores.sqlite"));
}

TEST(OutputPathsTest, VideoLayout)
{
    VideoOutputPaths paths = OutputPaths::video("/data/out");
    EXPECT_EQ(paths.temp_dir, fs::path("/data/out/temp"));
    EXPECT_EQ(paths.digest_clips_dir, fs::path("/data/out/digest_clips"));
    EXPECT_EQ(paths.manifest_path, fs::path("/data/out/scores/manifest.videos.json"));
    EXPECT_EQ(OutputPaths::splitClipsDir(paths), fs::path("/data/out/temp/clips"));
    EXPECT_EQ(OutputPaths::framesDir(paths), fs::path("/data/out/temp/frames"));
    EXPECT_EQ(OutputPaths::digestClipsSourceDir(paths, "trip"), fs::path("/data/out/digest_clips/trip"));
    EXPECT_EQ(OutputPaths::finalDigestPath(paths, "trip"), fs::path("/data/out/trip_digest.mp4"));
    EXPECT_EQ(OutputPaths::concatListPath(paths, "trip_root"), fs::path("/data/out/temp/concat/trip_root.txt"));
}

TEST(OutputPathsTest, SourceLabelsSuffixCollidingStems)
{
    std::map<std::string, std::string> labels =
        OutputPaths::sourceLabels({"a/trip.mp4", "b/trip.mov", "c/trip_2.mp4", "d/beach.mp4"});

    EXPECT_EQ(labels["a/trip.mp4"], "trip");
    EXPECT_EQ(labels["b/trip.mov"], "trip_2");
    EXPECT_EQ(labels["c/trip_2.mp4"], "trip_2_2");
    EXPECT_EQ(labels["d/beach.mp4"], "beach");
}
