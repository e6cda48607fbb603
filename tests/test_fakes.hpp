#pragma once

#include <gtest/gtest.h>
#include <cstdio>
#include <deque>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include "core/judge_client.hpp"
#include "core/media_error.hpp"
#include "core/media_tool.hpp"

/**
 * @brief Judge transport that replays queued responses
 *
 * When the queue is empty every call returns the fallback response.
 */
class FakeJudgeTransport : public JudgeTransport
{
public:
    std::deque<TransportResponse> responses;
    TransportResponse fallback;
    TransportResponse ping_response{true, 200, "{\"models\":[]}", ""};
    std::vector<std::string> posted_bodies;

    TransportResponse post(const std::string &path, const std::string &body) override
    {
        EXPECT_EQ(path, "/api/chat");
        posted_bodies.push_back(body);
        if (responses.empty())
            return fallback;
        TransportResponse next = responses.front();
        responses.pop_front();
        return next;
    }

    TransportResponse get(const std::string &path) override
    {
        EXPECT_EQ(path, "/api/tags");
        return ping_response;
    }

    static TransportResponse reply(const std::string &content)
    {
        nlohmann::json body = {{"message", {{"role", "assistant"}, {"content", content}}}};
        return TransportResponse{true, 200, body.dump(), ""};
    }

    static TransportResponse httpError(int status)
    {
        return TransportResponse{true, status, "server error", ""};
    }

    static TransportResponse connectionError()
    {
        return TransportResponse{false, 0, "", "HTTP request failed: Connection"};
    }
};

/**
 * @brief In-memory media tool: clips are plain files, frames are generated images
 */
class FakeMediaTool : public MediaTool
{
public:
    // Per source file name: durations of the segments to produce
    std::map<std::string, std::vector<double>> segments;
    // Per clip file name: frame to write; a solid gray frame otherwise
    std::map<std::string, cv::Mat> frames;
    std::vector<std::string> failing_sources;

    struct ConcatCall
    {
        std::vector<fs::path> clips;
        fs::path output;
        fs::path list_path;
    };
    std::vector<ConcatCall> concat_calls;

    VideoMetadata probe(const fs::path &) override
    {
        return VideoMetadata{};
    }

    std::vector<ClipInfo> splitVideo(const fs::path &source, const fs::path &output_dir, int min_clip, int,
                                     bool) override
    {
        const std::string name = source.filename().string();
        for (const auto &failing : failing_sources)
        {
            if (failing == name)
                throw MediaError(MediaErrorKind::TRANSCODE_FAILURE, "ffmpeg segment failed for " + name);
        }

        fs::create_directories(output_dir);
        std::vector<ClipInfo> clips;
        double start = 0.0;
        int index = 0;
        for (double duration : segments[name])
        {
            char clip_name[32];
            std::snprintf(clip_name, sizeof(clip_name), "clip_%04d.mp4", index++);
            const fs::path clip_path = output_dir / clip_name;
            std::ofstream(clip_path) << "clip";
            const double clip_start = start;
            start += duration;
            if (duration < min_clip)
                continue;

            ClipInfo clip;
            clip.source_path = source.string();
            clip.clip_path = clip_path.string();
            clip.start = clip_start;
            clip.end = clip_start + duration;
            clip.duration = duration;
            clip.width = 1920;
            clip.height = 1080;
            clip.fps = 30.0;
            clips.push_back(clip);
        }
        return clips;
    }

    void extractRepresentativeFrame(const fs::path &clip_path, const fs::path &output_path) override
    {
        fs::create_directories(output_path.parent_path());
        const std::string key = clip_path.parent_path().filename().string() + "/" + clip_path.filename().string();
        auto it = frames.find(key);
        cv::Mat frame = it != frames.end() ? it->second : cv::Mat(1080, 1920, CV_8UC3, cv::Scalar(128, 128, 128));
        if (!cv::imwrite(output_path.string(), frame))
            throw MediaError(MediaErrorKind::TRANSCODE_FAILURE, "cannot write frame " + output_path.string());
    }

    void concatClips(const std::vector<fs::path> &clips, const fs::path &output_path, bool,
                     const fs::path &list_path) override
    {
        concat_calls.push_back(ConcatCall{clips, output_path, list_path});
        fs::create_directories(output_path.parent_path());
        std::ofstream(output_path) << "digest";
    }
};
