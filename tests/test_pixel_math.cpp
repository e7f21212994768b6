#include <PixelMath.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace PixelMath;

namespace {

LogicalRect local(double x, double y, double w, double h) {
    return LogicalRect{x, y, w, h, CoordSpace::ScreenLocal};
}

} // namespace

TEST(PixelMathTest, FlipsYUpRectIntoTopLeftPixels) {
    // 2x display, 1280x800 logical (2560x1600 pixels)
    const PixelRect px = toPixelRect(local(100, 50, 300, 200), Scale{2.0, 2.0}, 800.0);
    EXPECT_EQ(px, (PixelRect{200, 1100, 600, 400}));
}

TEST(PixelMathTest, AlignedConversionMatchesRoundingOnWholePixels) {
    const LogicalRect r = local(100, 50, 300, 200);
    EXPECT_EQ(toPixelRectAligned(r, Scale{2.0, 2.0}, 800.0), toPixelRect(r, Scale{2.0, 2.0}, 800.0));
}

TEST(PixelMathTest, AlignedConversionCoversFractionalEdges) {
    // 1.5x: left edge 10.2 * 1.5 = 15.3, right edge 30.2 * 1.5 = 45.3
    const PixelRect px = toPixelRectAligned(local(10.2, 0, 20, 20), Scale{1.5, 1.5}, 100.0);
    EXPECT_EQ(px.x, 15);
    EXPECT_EQ(px.x + px.width, 46);
}

TEST(PixelMathTest, ClampsToMinimumCaptureSize) {
    const PixelRect px = toPixelRect(local(0, 0, 4, 3), Scale{1.0, 1.0}, 100.0);
    EXPECT_EQ(px.width, kMinCapturePixels);
    EXPECT_EQ(px.height, kMinCapturePixels);

    const PixelRect aligned = toPixelRectAligned(local(0, 0, 4, 3), Scale{2.0, 2.0}, 100.0);
    EXPECT_GE(aligned.width, kMinCapturePixels);
    EXPECT_GE(aligned.height, kMinCapturePixels);
}

TEST(PixelMathTest, PerAxisScale) {
    const PixelRect px = toPixelRect(local(10, 10, 100, 50), Scale{2.0, 1.0}, 200.0);
    EXPECT_EQ(px, (PixelRect{20, 140, 200, 50}));
}

TEST(PixelMathTest, RejectsGlobalRects) {
    const LogicalRect global{0, 0, 100, 100, CoordSpace::Global};
    EXPECT_THROW(toPixelRect(global, Scale{}, 100.0), std::invalid_argument);
    EXPECT_THROW(toPixelRectAligned(global, Scale{}, 100.0), std::invalid_argument);
    EXPECT_THROW(toGlobal(global, Display{}), std::invalid_argument);
    EXPECT_THROW(toLocal(local(0, 0, 1, 1), Display{}), std::invalid_argument);
}

TEST(PixelMathTest, SnapIsIdempotentAndLandsOnGrid) {
    const double scales[] = {1.0, 1.25, 1.5, 2.0, 3.0};
    const LogicalRect samples[] = {
        local(100.3, 50.7, 300.1, 200.9),
        local(0.1, 0.2, 11.3, 17.77),
        local(1234.567, 89.01, 456.78, 123.45),
    };

    for (double s : scales) {
        for (const LogicalRect& r : samples) {
            const LogicalRect once = snapToPixelGrid(r, Scale{s, s});
            const LogicalRect twice = snapToPixelGrid(once, Scale{s, s});
            EXPECT_EQ(once, twice) << "scale " << s << " rect " << toString(r);
            EXPECT_TRUE(isOnPixelGrid(once.x, s));
            EXPECT_TRUE(isOnPixelGrid(once.y, s));
            EXPECT_TRUE(isOnPixelGrid(once.width, s));
            EXPECT_TRUE(isOnPixelGrid(once.height, s));
        }
    }
}

TEST(PixelMathTest, SnapUsesEachAxisOwnScale) {
    const LogicalRect snapped = snapToPixelGrid(local(10.3, 10.3, 20.3, 20.3), Scale{2.0, 1.0});
    EXPECT_DOUBLE_EQ(snapped.x, 10.5);
    EXPECT_DOUBLE_EQ(snapped.y, 10.0);
    EXPECT_DOUBLE_EQ(snapped.width, 20.5);
    EXPECT_DOUBLE_EQ(snapped.height, 20.0);
    EXPECT_EQ(snapped.space, CoordSpace::ScreenLocal);
}

TEST(PixelMathTest, SnappedRectConvertsWithoutRoundingLoss) {
    const Scale scale{2.0, 2.0};
    const LogicalRect snapped = snapToPixelGrid(local(100.3, 50.2, 300.4, 200.1), scale);
    const PixelRect px = toPixelRect(snapped, scale, 800.0);

    EXPECT_DOUBLE_EQ(px.x / scale.x, snapped.x);
    EXPECT_DOUBLE_EQ(px.width / scale.x, snapped.width);
    EXPECT_DOUBLE_EQ(800.0 - px.y / scale.y - px.height / scale.y, snapped.y);
}

TEST(PixelMathTest, LocalGlobalRoundTrip) {
    Display d;
    d.frame = LogicalRect{1280, 280, 1920, 1080, CoordSpace::Global};

    const LogicalRect r = local(10, 20, 30, 40);
    const LogicalRect g = toGlobal(r, d);
    EXPECT_EQ(g, (LogicalRect{1290, 300, 30, 40, CoordSpace::Global}));
    EXPECT_EQ(toLocal(g, d), r);
}

TEST(PixelMathTest, SnappedRoundTripAtFractionalScale) {
    Display d;
    d.frame = LogicalRect{1536, 0, 1536, 864, CoordSpace::Global};
    d.scale = Scale{1.25, 1.25};

    // 5.6 and 10.4 are not exact in binary; plain addition loses them
    const LogicalRect r = snapToPixelGrid(local(5.61, 10.3, 100.2, 50.7), d.scale);
    const LogicalRect g = toGlobal(r, d);
    EXPECT_TRUE(isOnPixelGrid(g.x, 1.25));
    EXPECT_TRUE(isOnPixelGrid(g.y, 1.25));
    EXPECT_EQ(toLocal(g, d), r);

    d.frame.x = 1280;
    d.frame.y = 720;
    d.scale = Scale{1.5, 1.75};
    const LogicalRect s = snapToPixelGrid(local(33.3, 17.9, 200.1, 90.05), d.scale);
    EXPECT_EQ(toLocal(toGlobal(s, d), d), s);
}

TEST(PixelMathTest, TopLeftLogicalDividesByScale) {
    const LogicalRect r = toTopLeftLogical(PixelRect{200, 1100, 600, 400}, Scale{2.0, 2.0});
    EXPECT_EQ(r, local(100, 550, 300, 200));
}

TEST(PixelMathTest, SpanningIsOrderIndependent) {
    const LogicalRect a = spanning(LogicalPoint{50, 80}, LogicalPoint{10, 20});
    const LogicalRect b = spanning(LogicalPoint{10, 20}, LogicalPoint{50, 80});
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, local(10, 20, 40, 60));
}
