#pragma once

#include <string>
#include <vector>

/**
 * @brief Encodes images for transport to the judge
 */
class ImagePayload
{
public:
    /**
     * @brief Decode an image and re-encode it as base64 JPEG (PNG stays PNG)
     * @throws MediaError (DecodeFailure) when the file cannot be decoded or re-encoded
     */
    static std::string encodeFileBase64(const std::string &file_path);

    static std::string base64Encode(const std::vector<unsigned char> &bytes);
};
