#include "test_utils.h"

#include <vshadertest/image.hpp>

using namespace vshadertest;
using vshadertest_test::ReadFile;
using vshadertest_test::TempDir;
using vshadertest_test::TinyPpm;
using vshadertest_test::WriteFile;

namespace
{
    RgbImage read_ok(const std::string& path)
    {
        auto r = read_ppm(path);
        EXPECT_TRUE(r.isOk()) << r.error().message;
        return r.isOk() ? r.value() : RgbImage {};
    }
} // namespace

// ------------------------------------------------------------
// Decoding
// ------------------------------------------------------------

TEST(ImageTest, ReadsBinaryPixmap)
{
    TempDir tmp;
    ASSERT_TRUE(WriteFile(tmp.file("a.ppm"), TinyPpm()));

    const RgbImage img = read_ok(tmp.file("a.ppm"));
    EXPECT_EQ(img.width, 2u);
    EXPECT_EQ(img.height, 1u);
    const std::vector<uint8_t> expected = {255, 0, 0, 0, 0, 255};
    EXPECT_EQ(img.pixels, expected);
}

TEST(ImageTest, ReadsHeaderComments)
{
    TempDir tmp;
    const std::string data = std::string("P6\n# vkrunner\n1 2\n255\n") + std::string("\x0a\x14\x1e\x28\x32\x3c", 6);
    ASSERT_TRUE(WriteFile(tmp.file("a.ppm"), data));

    const RgbImage img = read_ok(tmp.file("a.ppm"));
    EXPECT_EQ(img.width, 1u);
    EXPECT_EQ(img.height, 2u);
    const std::vector<uint8_t> expected = {10, 20, 30, 40, 50, 60};
    EXPECT_EQ(img.pixels, expected);
}

TEST(ImageTest, RejectsAsciiPixmap)
{
    TempDir tmp;
    ASSERT_TRUE(WriteFile(tmp.file("a.ppm"), "P3\n1 1\n255\n1 2 3\n"));

    auto r = read_ppm(tmp.file("a.ppm"));
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eImageError);
    EXPECT_NE(r.error().message.find("not a binary (P6) pixmap"), std::string::npos);
}

TEST(ImageTest, RejectsGarbage)
{
    TempDir tmp;
    ASSERT_TRUE(WriteFile(tmp.file("a.ppm"), "not an image"));

    auto r = read_ppm(tmp.file("a.ppm"));
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eImageError);
}

TEST(ImageTest, RejectsTruncatedPixels)
{
    TempDir tmp;
    ASSERT_TRUE(WriteFile(tmp.file("a.ppm"), std::string("P6\n64 64\n255\n") + std::string(5, '\x7f')));

    auto r = read_ppm(tmp.file("a.ppm"));
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eImageError);
    EXPECT_NE(r.error().message.find("truncated pixel data"), std::string::npos);
}

TEST(ImageTest, RejectsTruncatedHeader)
{
    TempDir tmp;
    ASSERT_TRUE(WriteFile(tmp.file("a.ppm"), "P6\n4"));

    auto r = read_ppm(tmp.file("a.ppm"));
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eImageError);
}

TEST(ImageTest, HugeHeaderIsAnErrorNotACrash)
{
    TempDir tmp;
    ASSERT_TRUE(WriteFile(tmp.file("max.ppm"), "P6\n4294967295 4294967295\n255\nabc"));
    ASSERT_TRUE(WriteFile(tmp.file("big.ppm"), "P6\n20000 20000\n255\nabc"));

    for (const char* name : {"max.ppm", "big.ppm"})
    {
        auto r = read_ppm(tmp.file(name));
        ASSERT_FALSE(r.isOk()) << name;
        EXPECT_EQ(r.error().code, ErrorCode::eImageError) << name;

        auto n = normalize_image(tmp.file(name), tmp.file("out.png"));
        ASSERT_FALSE(n.isOk()) << name;
        EXPECT_EQ(n.error().code, ErrorCode::eImageError) << name;
    }
    EXPECT_TRUE(ReadFile(tmp.file("out.png")).empty());
}

TEST(ImageTest, MissingFileIsIoError)
{
    auto r = read_ppm("/nonexistent/vshadertest/raster.ppm");
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eIO);
}

// ------------------------------------------------------------
// Encoding
// ------------------------------------------------------------

TEST(ImageTest, WritePpmReadsBack)
{
    TempDir  tmp;
    RgbImage img;
    img.width  = 1;
    img.height = 2;
    img.pixels = {1, 2, 3, 4, 5, 6};

    ASSERT_TRUE(write_image(tmp.file("out.ppm"), img).isOk());
    EXPECT_EQ(ReadFile(tmp.file("out.ppm")), std::string("P6\n1 2\n255\n") + std::string("\x01\x02\x03\x04\x05\x06", 6));
}

TEST(ImageTest, WritePngHasSignature)
{
    TempDir  tmp;
    RgbImage img;
    img.width  = 2;
    img.height = 1;
    img.pixels = {255, 0, 0, 0, 0, 255};

    auto r = write_image(tmp.file("out.PNG"), img);
    ASSERT_TRUE(r.isOk()) << r.error().message;

    const std::string png = ReadFile(tmp.file("out.PNG"));
    ASSERT_GE(png.size(), 8u);
    EXPECT_EQ(png.substr(0, 8), std::string("\x89PNG\r\n\x1a\n", 8));
}

TEST(ImageTest, WriteBmpHasSignature)
{
    TempDir  tmp;
    RgbImage img;
    img.width  = 1;
    img.height = 1;
    img.pixels = {9, 9, 9};

    ASSERT_TRUE(write_image(tmp.file("out.bmp"), img).isOk());
    EXPECT_EQ(ReadFile(tmp.file("out.bmp")).substr(0, 2), "BM");
}

TEST(ImageTest, UnknownExtensionIsRejected)
{
    TempDir  tmp;
    RgbImage img;
    img.width  = 1;
    img.height = 1;
    img.pixels = {0, 0, 0};

    auto r = write_image(tmp.file("out.webp"), img);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eImageError);
    EXPECT_NE(r.error().message.find(".webp"), std::string::npos);
}

TEST(ImageTest, OversizedImageIsRejected)
{
    TempDir  tmp;
    RgbImage img;
    img.width  = 0x80000000u;
    img.height = 1;

    auto r = write_image(tmp.file("out.png"), img);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eInvalidArgument);
}

TEST(ImageTest, MismatchedBufferIsRejected)
{
    TempDir  tmp;
    RgbImage img;
    img.width  = 2;
    img.height = 2;
    img.pixels = {0, 0, 0};

    auto r = write_image(tmp.file("out.png"), img);
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eInvalidArgument);
}

// ------------------------------------------------------------
// Normalization
// ------------------------------------------------------------

TEST(ImageTest, NormalizeCreatesOutputDirectories)
{
    TempDir tmp;
    ASSERT_TRUE(WriteFile(tmp.file("raster.ppm"), TinyPpm()));

    const std::string out = tmp.file("renders/nested/out.png");
    auto              r   = normalize_image(tmp.file("raster.ppm"), out);
    ASSERT_TRUE(r.isOk()) << r.error().message;
    EXPECT_FALSE(ReadFile(out).empty());
}

TEST(ImageTest, NormalizeReportsUndecodableRaster)
{
    TempDir tmp;
    ASSERT_TRUE(WriteFile(tmp.file("raster.ppm"), "not an image"));

    auto r = normalize_image(tmp.file("raster.ppm"), tmp.file("out.png"));
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eImageError);
    EXPECT_TRUE(ReadFile(tmp.file("out.png")).empty());
}

TEST(ImageTest, NormalizeFailsWhenDirectoryIsAFile)
{
    TempDir tmp;
    ASSERT_TRUE(WriteFile(tmp.file("raster.ppm"), TinyPpm()));
    ASSERT_TRUE(WriteFile(tmp.file("blocker"), "x"));

    auto r = normalize_image(tmp.file("raster.ppm"), tmp.file("blocker/out.png"));
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(r.error().code, ErrorCode::eImageError);
    EXPECT_NE(r.error().message.find("Failed to create output directory"), std::string::npos);
}
