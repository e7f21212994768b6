#include "Fakes.hpp"
#include <PixelMath.hpp>
#include <RegionSelector.hpp>
#include <gtest/gtest.h>

using namespace Selection;
using PixelMath::CoordSpace;
using PixelMath::LogicalPoint;
using PixelMath::LogicalRect;

namespace {

class RegionSelectorTest : public ::testing::Test {
protected:
    // 2x display placed right of a 1x one in global space
    PixelMath::Display display = Fakes::makeDisplay(7, "DP-2", LogicalRect{1920, 100, 1280, 800}, 2.0);

    std::optional<LogicalRect> result;
    int completions = 0;

    void watch(RegionSelector& selector) {
        selector.setCompletionCallback([this](const std::optional<LogicalRect>& r) {
            ++completions;
            result = r;
        });
    }
};

} // namespace

TEST_F(RegionSelectorTest, CompletedDragIsSnappedAndGlobal) {
    RegionSelector selector(display);
    watch(selector);

    selector.pointerDown(LogicalPoint{100.3, 50.2});
    selector.pointerMove(LogicalPoint{250.0, 150.0});
    selector.pointerUp(LogicalPoint{400.4, 250.1});

    ASSERT_EQ(completions, 1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(selector.state(), SelectorState::Completed);
    EXPECT_EQ(result->space, CoordSpace::Global);

    // Snapped to half units, then offset by the display's origin
    EXPECT_DOUBLE_EQ(result->x, 1920.0 + 100.5);
    EXPECT_DOUBLE_EQ(result->y, 100.0 + 50.0);
    EXPECT_DOUBLE_EQ(result->width, 300.0);
    EXPECT_DOUBLE_EQ(result->height, 200.0);
}

TEST_F(RegionSelectorTest, DragInAnyDirection) {
    RegionSelector selector(display);
    watch(selector);

    selector.pointerDown(LogicalPoint{400, 250});
    selector.pointerUp(LogicalPoint{100, 50});

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, (LogicalRect{2020, 150, 300, 200, CoordSpace::Global}));
}

TEST_F(RegionSelectorTest, TinyDragIsDiscardedWithoutResult) {
    RegionSelector selector(display);
    watch(selector);

    selector.pointerDown(LogicalPoint{100, 100});
    selector.pointerUp(LogicalPoint{105, 105});

    EXPECT_EQ(completions, 1);
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(selector.state(), SelectorState::Cancelled);
    EXPECT_TRUE(selector.wasDegenerate());
}

TEST_F(RegionSelectorTest, BothSidesMustExceedTheThreshold) {
    RegionSelector selector(display);
    watch(selector);

    // Wide but exactly 10 units tall
    selector.pointerDown(LogicalPoint{0, 0});
    selector.pointerUp(LogicalPoint{300, 10});

    EXPECT_FALSE(result.has_value());
    EXPECT_TRUE(selector.wasDegenerate());
}

TEST_F(RegionSelectorTest, FeedbackCarriesHoleMask) {
    RegionSelector selector(display);
    std::vector<HoleMask> masks;
    selector.setFeedbackCallback([&masks](const HoleMask& m) { masks.push_back(m); });

    selector.pointerDown(LogicalPoint{100, 100});
    EXPECT_TRUE(masks.empty());
    selector.pointerMove(LogicalPoint{300, 200});

    ASSERT_EQ(masks.size(), 1u);
    EXPECT_EQ(masks[0].bounds, (LogicalRect{0, 0, 1280, 800, CoordSpace::ScreenLocal}));
    EXPECT_EQ(masks[0].hole, (LogicalRect{100, 100, 200, 100, CoordSpace::ScreenLocal}));

    // Everything outside the hole, nothing inside it
    const std::vector<LogicalRect> dimmed = masks[0].dimmedRects();
    ASSERT_EQ(dimmed.size(), 4u);
    double area = 0.0;
    for (const LogicalRect& r : dimmed) {
        area += r.width * r.height;
        EXPECT_FALSE(r.contains(LogicalPoint{150, 150}));
    }
    EXPECT_DOUBLE_EQ(area, 1280.0 * 800.0 - 200.0 * 100.0);
}

TEST_F(RegionSelectorTest, HoleAtTheEdgeLeavesFewerDimmedRects) {
    HoleMask mask;
    mask.bounds = LogicalRect{0, 0, 100, 100, CoordSpace::ScreenLocal};
    mask.hole = LogicalRect{0, 0, 50, 100, CoordSpace::ScreenLocal};

    const std::vector<LogicalRect> dimmed = mask.dimmedRects();
    ASSERT_EQ(dimmed.size(), 1u);
    EXPECT_EQ(dimmed[0], (LogicalRect{50, 0, 50, 100, CoordSpace::ScreenLocal}));

    mask.hole = LogicalRect{};
    EXPECT_EQ(mask.dimmedRects().size(), 1u);
}

TEST_F(RegionSelectorTest, CancelFinishesWithoutResult) {
    RegionSelector selector(display);
    watch(selector);

    selector.pointerDown(LogicalPoint{10, 10});
    selector.cancel();
    selector.pointerUp(LogicalPoint{500, 500});

    EXPECT_EQ(completions, 1);
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(selector.wasDegenerate());
}

TEST_F(RegionSelectorTest, ReleaseWithoutPressCancels) {
    RegionSelector selector(display);
    watch(selector);

    selector.pointerUp(LogicalPoint{500, 500});
    EXPECT_EQ(completions, 1);
    EXPECT_FALSE(result.has_value());
}

TEST_F(RegionSelectorTest, OnlyOneSelectorOpenAtATime) {
    auto first = std::make_unique<RegionSelector>(display);
    watch(*first);
    EXPECT_EQ(RegionSelector::openInstance(), first.get());

    RegionSelector second(display);
    EXPECT_EQ(RegionSelector::openInstance(), &second);
    EXPECT_TRUE(first->isFinished());

    // The replaced selector never reports and ignores further input
    first->pointerDown(LogicalPoint{0, 0});
    first->pointerUp(LogicalPoint{300, 300});
    EXPECT_EQ(completions, 0);

    first.reset();
    EXPECT_EQ(RegionSelector::openInstance(), &second);
}

TEST_F(RegionSelectorTest, FinishedSelectorIsNoLongerOpen) {
    RegionSelector selector(display);
    selector.cancel();
    EXPECT_EQ(RegionSelector::openInstance(), nullptr);
}
