#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need a scratch directory and synthetic images
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        scratch_dir_ = std::filesystem::temp_directory_path() /
                       ("reel_curator_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                        std::to_string(getpid()));
        std::filesystem::remove_all(scratch_dir_);
        std::filesystem::create_directories(scratch_dir_);
        Logger::init("WARN");
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(scratch_dir_, ec);
        if (ec)
        {
            Logger::warn("Failed to remove scratch directory " + scratch_dir_.string() + ": " + ec.message());
        }
    }

    const std::filesystem::path &scratchDir() const { return scratch_dir_; }

    // Helper to create a text file, parents included
    std::filesystem::path writeFile(const std::filesystem::path &relative, const std::string &content = "data")
    {
        std::filesystem::path path = scratch_dir_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path writeImage(const std::filesystem::path &relative, const cv::Mat &image)
    {
        std::filesystem::path path = scratch_dir_ / relative;
        std::filesystem::create_directories(path.parent_path());
        EXPECT_TRUE(cv::imwrite(path.string(), image)) << "cannot write " << path;
        return path;
    }

    static cv::Mat solidImage(int width, int height, uchar value)
    {
        return cv::Mat(height, width, CV_8UC3, cv::Scalar(value, value, value));
    }

    // Left half black, right half white
    static cv::Mat splitImage(int width, int height)
    {
        cv::Mat image(height, width, CV_8UC3, cv::Scalar(0, 0, 0));
        image(cv::Rect(width / 2, 0, width - width / 2, height)).setTo(cv::Scalar(255, 255, 255));
        return image;
    }

    // Top half black, bottom half white
    static cv::Mat verticalSplitImage(int width, int height)
    {
        cv::Mat image(height, width, CV_8UC3, cv::Scalar(0, 0, 0));
        image(cv::Rect(0, height / 2, width, height - height / 2)).setTo(cv::Scalar(255, 255, 255));
        return image;
    }

    static cv::Mat checkerboard(int width, int height, int cell)
    {
        cv::Mat image(height, width, CV_8UC3, cv::Scalar(0, 0, 0));
        for (int y = 0; y < height; y += cell)
        {
            for (int x = 0; x < width; x += cell)
            {
                if (((x / cell) + (y / cell)) % 2 == 0)
                {
                    cv::rectangle(image, cv::Rect(x, y, std::min(cell, width - x), std::min(cell, height - y)),
                                  cv::Scalar(255, 255, 255), cv::FILLED);
                }
            }
        }
        return image;
    }

private:
    std::filesystem::path scratch_dir_;
};
