#include "test_base.hpp"
#include "core/image_payload.hpp"
#include "core/media_error.hpp"

namespace fs = std::filesystem;

class ImagePayloadTest : public TestBase
{
};

TEST_F(ImagePayloadTest, PngStaysPngRegardlessOfExtensionCase)
{
    auto path = writeImage("shot.PNG", splitImage(32, 24));

    std::string payload = ImagePayload::encodeFileBase64(path.string());
    EXPECT_EQ(payload.rfind("iVBORw0KGgo", 0), 0u);
}

TEST_F(ImagePayloadTest, NonAsciiExtensionFallsBackToJpeg)
{
    auto png = writeImage("shot.png", splitImage(32, 24));
    fs::path odd = scratchDir() / "shot.\xC3\x89PNG";
    fs::copy_file(png, odd);

    std::string payload = ImagePayload::encodeFileBase64(odd.string());
    EXPECT_EQ(payload.rfind("/9j/", 0), 0u);
}

TEST_F(ImagePayloadTest, UndecodableFileIsDecodeFailure)
{
    auto path = writeFile("broken.jpg", "not an image");
    try
    {
        ImagePayload::encodeFileBase64(path.string());
        FAIL() << "expected DecodeFailure";
    }
    catch (const MediaError &e)
    {
        EXPECT_EQ(e.kind(), MediaErrorKind::DECODE_FAILURE);
    }
}

TEST(ImagePayloadBase64Test, EncodesWithPadding)
{
    EXPECT_EQ(ImagePayload::base64Encode({'h', 'e', 'l', 'l', 'o'}), "aGVsbG8=");
    EXPECT_EQ(ImagePayload::base64Encode({}), "");
}
