#include "test_base.hpp"
#include "core/media_error.hpp"
#include "core/quality_analyzer.hpp"

class QualityAnalyzerTest : public TestBase
{
};

TEST_F(QualityAnalyzerTest, FlatImageIsBlurredEverywhere)
{
    QualityMetrics quality = QualityAnalyzer::analyze(solidImage(200, 100, 128));

    EXPECT_NEAR(quality.brightness, 128.0, 0.5);
    EXPECT_DOUBLE_EQ(quality.resolution, 20000.0);
    EXPECT_DOUBLE_EQ(quality.edge_variance, 0.0);
    EXPECT_DOUBLE_EQ(quality.center_edge_variance, 0.0);
    EXPECT_DOUBLE_EQ(quality.lower_edge_variance, 0.0);
    EXPECT_FALSE(quality.dark);
    EXPECT_FALSE(quality.overexposed);
    EXPECT_TRUE(quality.blur);
    EXPECT_TRUE(quality.blur_center);
    EXPECT_TRUE(quality.blur_lower);
    EXPECT_TRUE(quality.blur_strong);
}

TEST_F(QualityAnalyzerTest, ExposureFlags)
{
    EXPECT_TRUE(QualityAnalyzer::analyze(solidImage(64, 64, 20)).dark);
    EXPECT_FALSE(QualityAnalyzer::analyze(solidImage(64, 64, 50)).dark);
    EXPECT_TRUE(QualityAnalyzer::analyze(solidImage(64, 64, 230)).overexposed);
    EXPECT_FALSE(QualityAnalyzer::analyze(solidImage(64, 64, 205)).overexposed);
}

TEST_F(QualityAnalyzerTest, DetailedImageIsSharp)
{
    QualityMetrics quality = QualityAnalyzer::analyze(checkerboard(400, 400, 4));

    EXPECT_GT(quality.edge_variance, QualityAnalyzer::MIN_CENTER_EDGE_VARIANCE);
    EXPECT_GT(quality.center_edge_variance, QualityAnalyzer::MIN_CENTER_EDGE_VARIANCE);
    EXPECT_GT(quality.lower_edge_variance, QualityAnalyzer::MIN_LOWER_EDGE_VARIANCE);
    EXPECT_FALSE(quality.blur);
    EXPECT_FALSE(quality.blur_center);
    EXPECT_FALSE(quality.blur_lower);
    EXPECT_FALSE(quality.blur_strong);
}

TEST_F(QualityAnalyzerTest, DetailOutsideCenterLeavesCenterBlurred)
{
    // Texture only in the top band, above both measured regions
    cv::Mat image = solidImage(400, 400, 128);
    checkerboard(400, 80, 4).copyTo(image(cv::Rect(0, 0, 400, 80)));

    QualityMetrics quality = QualityAnalyzer::analyze(image);
    EXPECT_GT(quality.edge_variance, 0.0);
    EXPECT_TRUE(quality.blur_center);
    EXPECT_TRUE(quality.blur_strong);
    EXPECT_TRUE(quality.blur_lower);
}

TEST_F(QualityAnalyzerTest, RegionBounds)
{
    EXPECT_EQ(QualityAnalyzer::centerRegion(100, 200), cv::Rect(25, 50, 50, 100));
    EXPECT_EQ(QualityAnalyzer::lowerRegion(100, 200), cv::Rect(10, 100, 80, 90));
}

TEST_F(QualityAnalyzerTest, AnalyzeFileMatchesDecodedImage)
{
    cv::Mat image = checkerboard(120, 90, 6);
    auto path = writeImage("board.png", image);

    QualityMetrics from_file = QualityAnalyzer::analyzeFile(path.string());
    QualityMetrics direct = QualityAnalyzer::analyze(image);
    EXPECT_NEAR(from_file.brightness, direct.brightness, 1e-9);
    EXPECT_NEAR(from_file.edge_variance, direct.edge_variance, 1e-9);
}

TEST_F(QualityAnalyzerTest, AnalyzeFileUsesColorDecodeOfJpeg)
{
    cv::Mat image(90, 120, CV_8UC3);
    for (int y = 0; y < image.rows; y++)
    {
        for (int x = 0; x < image.cols; x++)
            image.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x * 2), static_cast<uchar>(y * 2),
                                                  static_cast<uchar>((x + y) % 256));
    }
    auto path = writeImage("colors.jpg", image);

    cv::Mat decoded = cv::imread(path.string(), cv::IMREAD_COLOR);
    ASSERT_FALSE(decoded.empty());
    QualityMetrics from_file = QualityAnalyzer::analyzeFile(path.string());
    QualityMetrics direct = QualityAnalyzer::analyze(decoded);
    EXPECT_DOUBLE_EQ(from_file.brightness, direct.brightness);
    EXPECT_DOUBLE_EQ(from_file.edge_variance, direct.edge_variance);
    EXPECT_DOUBLE_EQ(from_file.center_edge_variance, direct.center_edge_variance);
}

TEST_F(QualityAnalyzerTest, AnalyzeFileReportsDecodeFailure)
{
    EXPECT_THROW(QualityAnalyzer::analyzeFile((scratchDir() / "missing.jpg").string()), MediaError);
}
