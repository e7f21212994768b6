#pragma once
#include "Geometry.hpp"

namespace PixelMath {

// Capture providers reject regions smaller than this on either axis.
constexpr int kMinCapturePixels = 16;

/**
 * @brief Direct rounding of a screen-local rect into provider pixels
 *
 * x_px = round(x * sx), y_px = round((H - y - h) * sy) (y-up to top-left flip),
 * w_px / h_px rounded independently and clamped to kMinCapturePixels.
 * @param displayHeight Logical height H of the owning display
 * @throws std::invalid_argument if the rect is not ScreenLocal
 */
PixelRect toPixelRect(const LogicalRect& local, Scale scale, double displayHeight);

/**
 * @brief Boundary-aligned conversion for high-density displays
 *
 * Floors the minimum corner and ceils the maximum corner per axis, then
 * derives width/height as the difference so adjacent selections never
 * leave a gutter or overlap by a pixel.
 * @throws std::invalid_argument if the rect is not ScreenLocal
 */
PixelRect toPixelRectAligned(const LogicalRect& local, Scale scale, double displayHeight);

/**
 * @brief Re-derives a top-left oriented logical rect from a pixel rect
 *
 * For consumers that still expect logical units (screencopy regions).
 * The result is ScreenLocal but y-down, measured from the display's top edge.
 */
LogicalRect toTopLeftLogical(const PixelRect& px, Scale scale);

/**
 * @brief Snaps origin and size to the display's per-axis pixel grid
 *
 * Each of x, y, width, height becomes round(v * s) / s with the axis'
 * own scale. Idempotent for scale >= 1.
 */
LogicalRect snapToPixelGrid(const LogicalRect& r, Scale scale);

// True if v lands on an integer multiple of 1/scale (within tolerance).
bool isOnPixelGrid(double v, double scale);

LogicalRect toGlobal(const LogicalRect& local, const Display& display);
LogicalRect toLocal(const LogicalRect& global, const Display& display);

// Screen-local, y-up rect spanning two points in any order.
LogicalRect spanning(const LogicalPoint& a, const LogicalPoint& b);

} // namespace PixelMath
