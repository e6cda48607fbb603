#include "core/image_payload.hpp"
#include "core/media_error.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <openssl/evp.h>

std::string ImagePayload::encodeFileBase64(const std::string &file_path)
{
    cv::Mat image = cv::imread(file_path, cv::IMREAD_UNCHANGED);
    if (image.empty())
    {
        throw MediaError(MediaErrorKind::DECODE_FAILURE, "Cannot decode image: " + file_path);
    }

    std::string extension = std::filesystem::path(file_path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    const bool keep_png = extension == ".png";

    // JPEG carries no alpha channel
    if (!keep_png && image.channels() == 4)
        cv::cvtColor(image, image, cv::COLOR_BGRA2BGR);

    std::vector<unsigned char> buffer;
    bool encoded = false;
    try
    {
        encoded = cv::imencode(keep_png ? ".png" : ".jpg", image, buffer);
    }
    catch (const cv::Exception &e)
    {
        throw MediaError(MediaErrorKind::DECODE_FAILURE, "Cannot re-encode image " + file_path + ": " + e.what());
    }
    if (!encoded)
    {
        throw MediaError(MediaErrorKind::DECODE_FAILURE, "Cannot re-encode image: " + file_path);
    }
    return base64Encode(buffer);
}

std::string ImagePayload::base64Encode(const std::vector<unsigned char> &bytes)
{
    if (bytes.empty())
        return "";

    // EVP_EncodeBlock also writes a trailing NUL
    std::string output(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&output[0]), bytes.data(),
                                  static_cast<int>(bytes.size()));
    output.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return output;
}
