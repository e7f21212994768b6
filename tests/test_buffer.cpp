#include <buffer.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using IMGBuffer::Buffer;
using IMGBuffer::FrameView;
using IMGBuffer::PixelFormat;

TEST(BufferTest, ResizeAllocatesPackedRows) {
    Buffer buffer(3, 2);
    EXPECT_EQ(buffer.width(), 3u);
    EXPECT_EQ(buffer.height(), 2u);
    EXPECT_EQ(buffer.stride(), 12u);
}

TEST(BufferTest, AssignDropsRowPadding) {
    // 2x2 frame with 4 bytes of padding per row
    std::vector<std::uint8_t> pixels = {
        1, 2, 3, 4, 5, 6, 7, 8, 0xee, 0xee, 0xee, 0xee,
        9, 10, 11, 12, 13, 14, 15, 16, 0xee, 0xee, 0xee, 0xee,
    };
    FrameView view;
    view.data = pixels.data();
    view.width = 2;
    view.height = 2;
    view.stride = 12;
    view.format = PixelFormat::RGBA8;

    Buffer buffer;
    buffer.assign(view, 42);

    EXPECT_EQ(buffer.stride(), 8u);
    EXPECT_EQ(buffer.sequence(), 42u);
    EXPECT_EQ(buffer.format(), PixelFormat::RGBA8);

    const std::vector<std::uint8_t> packed(buffer.data(), buffer.data() + buffer.stride() * buffer.height());
    EXPECT_EQ(packed, (std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16}));
}

TEST(BufferTest, AssignFollowsFrameSize) {
    std::vector<std::uint8_t> small(4 * 4 * 4, 1);
    std::vector<std::uint8_t> large(8 * 2 * 4, 2);

    FrameView view;
    view.data = small.data();
    view.width = 4;
    view.height = 4;
    view.stride = 16;

    Buffer buffer;
    buffer.assign(view, 1);
    EXPECT_EQ(buffer.width(), 4u);

    view.data = large.data();
    view.width = 8;
    view.height = 2;
    view.stride = 32;
    buffer.assign(view, 2);
    EXPECT_EQ(buffer.width(), 8u);
    EXPECT_EQ(buffer.height(), 2u);
    EXPECT_EQ(buffer.data()[0], 2);
}

TEST(BufferTest, RejectsInvalidViews) {
    std::vector<std::uint8_t> pixels(64, 0);
    Buffer buffer;

    FrameView noData;
    noData.width = 2;
    noData.height = 2;
    noData.stride = 8;
    EXPECT_THROW(buffer.assign(noData, 1), std::invalid_argument);

    FrameView narrow;
    narrow.data = pixels.data();
    narrow.width = 4;
    narrow.height = 2;
    narrow.stride = 8;
    EXPECT_THROW(buffer.assign(narrow, 1), std::invalid_argument);
}
