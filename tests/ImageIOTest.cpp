#include <gtest/gtest.h>

#include <cstdio>
#include <string>

#include "image/ImageIO.hpp"
#include "platform/FileUtil.hpp"
#include "TestSupport.hpp"

namespace gamevision {
namespace {

TEST(ImageIOTest, PngPreservesPixels) {
    const std::string path = ::testing::TempDir() + "gamevision_io_test.png";
    PixelBuffer image = test::noiseImage(37, 23, 17);
    std::string err;
    ASSERT_TRUE(saveImage(image, path, ImageFormat::Png, 90, &err)) << err;

    PixelBuffer loaded;
    ASSERT_TRUE(loadImage(path, loaded, &err)) << err;
    EXPECT_EQ(loaded.w, 37);
    EXPECT_EQ(loaded.h, 23);
    EXPECT_EQ(loaded.rgba, image.rgba);
    std::remove(path.c_str());
}

TEST(ImageIOTest, JpegKeepsDimensions) {
    const std::string path = ::testing::TempDir() + "gamevision_io_test.jpg";
    PixelBuffer image = PixelBuffer::filled(40, 30, 200, 100, 50);
    std::string err;
    ASSERT_TRUE(saveImage(image, path, ImageFormat::Jpeg, 95, &err)) << err;

    PixelBuffer loaded;
    ASSERT_TRUE(loadImage(path, loaded, &err)) << err;
    EXPECT_EQ(loaded.w, 40);
    EXPECT_EQ(loaded.h, 30);
    EXPECT_NEAR(loaded.rgba[0], 200, 6);
    EXPECT_NEAR(loaded.rgba[1], 100, 6);
    EXPECT_NEAR(loaded.rgba[2], 50, 6);
    EXPECT_EQ(loaded.rgba[3], 255);
    std::remove(path.c_str());
}

TEST(ImageIOTest, MissingOrCorruptFilesFail) {
    PixelBuffer loaded;
    std::string err;
    EXPECT_FALSE(loadImage("/nonexistent/template.png", loaded, &err));
    EXPECT_FALSE(err.empty());

    const std::string path = ::testing::TempDir() + "gamevision_corrupt.png";
    std::string garbage = "not an image";
    ASSERT_TRUE(writeFileBytes(path, garbage.data(), garbage.size(), &err));
    err.clear();
    EXPECT_FALSE(loadImage(path, loaded, &err));
    EXPECT_FALSE(err.empty());
    std::remove(path.c_str());
}

TEST(ImageIOTest, RefusesEmptyImage) {
    std::string err;
    EXPECT_FALSE(saveImage(PixelBuffer(), ::testing::TempDir() + "empty.png",
                           ImageFormat::Png, 90, &err));
}

TEST(ImageFormatTest, ParsesNames) {
    ImageFormat format = ImageFormat::Png;
    EXPECT_TRUE(parseImageFormat("jpg", format));
    EXPECT_EQ(format, ImageFormat::Jpeg);
    EXPECT_TRUE(parseImageFormat("PNG", format));
    EXPECT_EQ(format, ImageFormat::Png);
    EXPECT_FALSE(parseImageFormat("webp", format));
}

}  // namespace
}  // namespace gamevision
