#include "test_base.hpp"
#include "core/manifest.hpp"
#include <iterator>

namespace fs = std::filesystem;

class ManifestTest : public TestBase
{
};

TEST_F(ManifestTest, MissingFileYieldsEmptyList)
{
    nlohmann::json photos = Manifest::load(scratchDir() / "absent.json");
    ASSERT_TRUE(photos.contains("photos"));
    EXPECT_TRUE(photos["photos"].is_array());
    EXPECT_TRUE(photos["photos"].empty());

    nlohmann::json videos = Manifest::load(scratchDir() / "absent.json", "sources");
    EXPECT_TRUE(videos["sources"].is_array());
}

TEST_F(ManifestTest, SaveCreatesParentsAndLoadsBack)
{
    fs::path path = scratchDir() / "scores" / "nested" / "manifest.json";
    nlohmann::json data = {{"input", "/photos"}, {"photos", {{{"path", "caf\xc3\xa9.jpg"}, {"selected", true}}}}};

    ASSERT_TRUE(Manifest::save(path, data));
    EXPECT_EQ(Manifest::load(path), data);

    // Non-ASCII characters are escaped
    std::ifstream file(path);
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("\\u00e9"), std::string::npos);
}

TEST_F(ManifestTest, InvalidJsonStartsFresh)
{
    fs::path path = writeFile("manifest.json", "{not json");
    EXPECT_TRUE(Manifest::load(path)["photos"].empty());
}
