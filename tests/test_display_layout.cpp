#include <DisplayLayout.hpp>
#include <gtest/gtest.h>

using namespace PixelMath;

namespace {

// A 2x laptop panel left of a 1x monitor, top edges aligned
DisplayLayout sideBySide() {
    LayoutOutput panel;
    panel.name = "eDP-1";
    panel.x = 0;
    panel.y = 0;
    panel.width = 1280;
    panel.height = 800;
    panel.pixelWidth = 2560;
    panel.pixelHeight = 1600;
    panel.scale = Scale{2.0, 2.0};
    panel.rootX = 0;
    panel.rootY = 0;

    LayoutOutput monitor;
    monitor.name = "HDMI-1";
    monitor.x = 1280;
    monitor.y = 0;
    monitor.width = 1920;
    monitor.height = 1080;
    monitor.pixelWidth = 1920;
    monitor.pixelHeight = 1080;
    monitor.scale = Scale{1.0, 1.0};
    monitor.rootX = 2560;
    monitor.rootY = 0;

    return DisplayLayout({panel, monitor});
}

} // namespace

TEST(DisplayLayoutTest, FlipsFramesIntoYUpGlobalSpace) {
    const DisplayLayout layout = sideBySide();
    ASSERT_EQ(layout.displays().size(), 2u);

    const Display& panel = layout.displays()[0];
    const Display& monitor = layout.displays()[1];

    // The desktop's bottom edge is the monitor's; the shorter panel sits higher
    EXPECT_EQ(panel.frame, (LogicalRect{0, 280, 1280, 800, CoordSpace::Global}));
    EXPECT_EQ(monitor.frame, (LogicalRect{1280, 0, 1920, 1080, CoordSpace::Global}));
    EXPECT_EQ(panel.pixelWidth, 2560);
    EXPECT_DOUBLE_EQ(panel.scale.x, 2.0);
}

TEST(DisplayLayoutTest, IdsFollowOutputNames) {
    const DisplayLayout layout = sideBySide();
    EXPECT_EQ(layout.displays()[0].id, DisplayLayout::idFor("eDP-1"));
    EXPECT_NE(DisplayLayout::idFor("eDP-1"), DisplayLayout::idFor("HDMI-1"));
    EXPECT_EQ(DisplayLayout::idFor(""), 14695981039346656037ull);

    ASSERT_TRUE(layout.find(DisplayLayout::idFor("HDMI-1")).has_value());
    EXPECT_EQ(layout.find(DisplayLayout::idFor("HDMI-1"))->name, "HDMI-1");
    EXPECT_FALSE(layout.find(DisplayLayout::idFor("DP-9")).has_value());
}

TEST(DisplayLayoutTest, DisplayAtUsesGlobalFrames) {
    const DisplayLayout layout = sideBySide();
    ASSERT_TRUE(layout.displayAt(LogicalPoint{100, 500}).has_value());
    EXPECT_EQ(layout.displayAt(LogicalPoint{100, 500})->name, "eDP-1");
    EXPECT_EQ(layout.displayAt(LogicalPoint{1300, 10})->name, "HDMI-1");

    // Below the panel, in the dead corner of the bounding box
    EXPECT_FALSE(layout.displayAt(LogicalPoint{100, 100}).has_value());
}

TEST(DisplayLayoutTest, RootPixelsToGlobalPoint) {
    const DisplayLayout layout = sideBySide();

    const LogicalPoint onMonitor = layout.fromRootPixels(2660, 50);
    EXPECT_DOUBLE_EQ(onMonitor.x, 1380.0);
    EXPECT_DOUBLE_EQ(onMonitor.y, 1030.0);

    const LogicalPoint onPanel = layout.fromRootPixels(200, 100);
    EXPECT_DOUBLE_EQ(onPanel.x, 100.0);
    EXPECT_DOUBLE_EQ(onPanel.y, 1030.0);
}

TEST(DisplayLayoutTest, GlobalRectToRootPixels) {
    const DisplayLayout layout = sideBySide();
    const Display panel = layout.displays()[0];
    const Display monitor = layout.displays()[1];

    // 100 logical units below the panel's top edge
    const PixelRect p = layout.toRootPixels(LogicalRect{100, 980, 200, 100, CoordSpace::Global}, panel);
    EXPECT_EQ(p, (PixelRect{200, 0, 400, 200}));

    const PixelRect m = layout.toRootPixels(LogicalRect{1380, 980, 200, 50, CoordSpace::Global}, monitor);
    EXPECT_EQ(m, (PixelRect{2660, 50, 200, 50}));
}

TEST(DisplayLayoutTest, RootOrigins) {
    const DisplayLayout layout = sideBySide();
    const auto origin = layout.rootOrigin(DisplayLayout::idFor("HDMI-1"));
    ASSERT_TRUE(origin.has_value());
    EXPECT_EQ(origin->first, 2560);
    EXPECT_EQ(origin->second, 0);
    EXPECT_FALSE(layout.rootOrigin(42).has_value());
}

TEST(DisplayLayoutTest, EmptyLayout) {
    const DisplayLayout layout;
    EXPECT_TRUE(layout.empty());
    EXPECT_FALSE(layout.displayAt(LogicalPoint{0, 0}).has_value());
}
