#include "core/fingerprint.hpp"
#include "core/media_error.hpp"
#include "logging/logger.hpp"
#include <bitset>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

uint64_t Fingerprint::compute(const cv::Mat &image)
{
    cv::Mat gray_image;
    if (image.channels() == 3)
        cv::cvtColor(image, gray_image, cv::COLOR_BGR2GRAY);
    else if (image.channels() == 4)
        cv::cvtColor(image, gray_image, cv::COLOR_BGRA2GRAY);
    else
        gray_image = image;

    cv::Mat resized_image;
    cv::resize(gray_image, resized_image, cv::Size(HASH_SIZE, HASH_SIZE), 0, 0, cv::INTER_AREA);

    double sum = 0.0;
    for (int y = 0; y < HASH_SIZE; y++)
    {
        for (int x = 0; x < HASH_SIZE; x++)
            sum += resized_image.at<uint8_t>(y, x);
    }
    const double mean = sum / (HASH_SIZE * HASH_SIZE);

    uint64_t hash_value = 0;
    int bit_index = 0;
    for (int y = 0; y < HASH_SIZE; y++)
    {
        for (int x = 0; x < HASH_SIZE; x++)
        {
            if (resized_image.at<uint8_t>(y, x) >= mean)
                hash_value |= (uint64_t{1} << bit_index);
            bit_index++;
        }
    }
    return hash_value;
}

uint64_t Fingerprint::fromFile(const std::string &file_path)
{
    cv::Mat image;
    try
    {
        image = cv::imread(file_path, cv::IMREAD_COLOR);
    }
    catch (const cv::Exception &e)
    {
        throw MediaError(MediaErrorKind::DECODE_FAILURE, "OpenCV error reading " + file_path + ": " + e.what());
    }
    if (image.empty())
    {
        throw MediaError(MediaErrorKind::DECODE_FAILURE, "Failed to load image: " + file_path);
    }
    return compute(image);
}

int Fingerprint::hammingDistance(uint64_t left, uint64_t right)
{
    return static_cast<int>(std::bitset<64>(left ^ right).count());
}

bool Fingerprint::isNearDuplicate(uint64_t candidate, const std::vector<uint64_t> &accepted, int threshold)
{
    for (uint64_t existing : accepted)
    {
        if (hammingDistance(candidate, existing) <= threshold)
            return true;
    }
    return false;
}

std::string Fingerprint::toHex(uint64_t value)
{
    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << value;
    return ss.str();
}

std::optional<uint64_t> Fingerprint::fromHex(const std::string &hex)
{
    if (hex.empty() || hex.size() > 16)
        return std::nullopt;
    for (char c : hex)
    {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
    }
    try
    {
        return static_cast<uint64_t>(std::stoull(hex, nullptr, 16));
    }
    catch (const std::exception &e)
    {
        Logger::debug("Unparsable fingerprint '" + hex + "': " + e.what());
        return std::nullopt;
    }
}
