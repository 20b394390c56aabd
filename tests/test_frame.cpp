#include <gtest/gtest.h>

#include "zedframe/Errors.hpp"
#include "zedframe/Frame.hpp"

namespace zedframe {

TEST(FrameTest, ExtractChannelsDropsAlpha) {
    Frame bgra(FrameKind::Image, 3, 2, 4);
    for (std::size_t i = 0; i < bgra.data.size(); ++i) {
        bgra.data[i] = static_cast<std::uint8_t>(i);
    }

    const Frame bgr = extractChannels(bgra, 3);
    ASSERT_EQ(bgr.shape(), (FrameShape{2, 3, 3}));
    ASSERT_EQ(bgr.sizeBytes(), 18u);
    for (std::size_t pixel = 0; pixel < 6; ++pixel) {
        EXPECT_EQ(bgr.data[pixel * 3 + 0], bgra.data[pixel * 4 + 0]);
        EXPECT_EQ(bgr.data[pixel * 3 + 1], bgra.data[pixel * 4 + 1]);
        EXPECT_EQ(bgr.data[pixel * 3 + 2], bgra.data[pixel * 4 + 2]);
    }
}

TEST(FrameTest, ExtractChannelsRejectsImpossibleCount) {
    Frame gray(FrameKind::DepthMap, 2, 2, 1);
    EXPECT_THROW(extractChannels(gray, 3), std::invalid_argument);
    EXPECT_EQ(extractChannels(gray, 1).data, gray.data);
}

TEST(FrameTest, ShapeParsesAndPrints) {
    const auto shape = FrameShape::parse("1080x1920x3");
    EXPECT_EQ(shape.height, 1080);
    EXPECT_EQ(shape.width, 1920);
    EXPECT_EQ(shape.channels, 3);
    EXPECT_EQ(shape.bytes(), 1080u * 1920u * 3u);
    EXPECT_EQ(shape.toString(), "1080x1920x3");

    EXPECT_THROW(FrameShape::parse("1080x1920"), ConfigurationError);
    EXPECT_THROW(FrameShape::parse("0x1920x3"), ConfigurationError);
    EXPECT_THROW(FrameShape::parse("1080*1920*3"), ConfigurationError);
}

} // namespace zedframe
