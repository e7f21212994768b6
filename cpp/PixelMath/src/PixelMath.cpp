#include "PixelMath.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace PixelMath {

namespace {

// Absorbs float noise such as 100.1 * 2 = 200.20000000000002 before floor/ceil.
constexpr double kEdgeEpsilon = 1e-6;

int roundToInt(double v) {
    return static_cast<int>(std::lround(v));
}

void requireSpace(const LogicalRect& r, CoordSpace expected, const char* what) {
    if (r.space != expected) {
        throw std::invalid_argument(std::string(what) + ": rect " + toString(r) +
                                    " is in the wrong coordinate space");
    }
}

double snapValue(double v, double scale) {
    return std::round(v * scale) / scale;
}

bool onGrid(double v, double scale) {
    const double scaled = v * scale;
    return std::fabs(scaled - std::round(scaled)) < 1e-9;
}

// Values on the pixel grid are shifted as whole device pixels, so the sum
// divides back to the same double snapValue produced.
double shift(double v, double offset, double scale) {
    if (scale > 0.0 && onGrid(v, scale) && onGrid(offset, scale)) {
        return (std::round(v * scale) + std::round(offset * scale)) / scale;
    }
    return v + offset;
}

} // namespace

bool operator==(const LogicalRect& a, const LogicalRect& b) {
    return a.space == b.space && a.x == b.x && a.y == b.y &&
           a.width == b.width && a.height == b.height;
}

bool operator!=(const LogicalRect& a, const LogicalRect& b) {
    return !(a == b);
}

bool operator==(const PixelRect& a, const PixelRect& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

bool operator!=(const PixelRect& a, const PixelRect& b) {
    return !(a == b);
}

std::string toString(const LogicalRect& r) {
    std::ostringstream out;
    out << (r.space == CoordSpace::Global ? "global" : "local")
        << "{" << r.x << ", " << r.y << ", " << r.width << "x" << r.height << "}";
    return out.str();
}

std::string toString(const PixelRect& r) {
    std::ostringstream out;
    out << "px{" << r.x << ", " << r.y << ", " << r.width << "x" << r.height << "}";
    return out.str();
}

PixelRect toPixelRect(const LogicalRect& local, Scale scale, double displayHeight) {
    requireSpace(local, CoordSpace::ScreenLocal, "toPixelRect");

    PixelRect px;
    px.x = roundToInt(local.x * scale.x);
    px.y = roundToInt((displayHeight - local.y - local.height) * scale.y);
    px.width = std::max(kMinCapturePixels, roundToInt(local.width * scale.x));
    px.height = std::max(kMinCapturePixels, roundToInt(local.height * scale.y));
    return px;
}

PixelRect toPixelRectAligned(const LogicalRect& local, Scale scale, double displayHeight) {
    requireSpace(local, CoordSpace::ScreenLocal, "toPixelRectAligned");

    // Edges in top-left pixel space before alignment
    const double left = local.x * scale.x;
    const double right = local.maxX() * scale.x;
    const double top = (displayHeight - local.maxY()) * scale.y;
    const double bottom = (displayHeight - local.y) * scale.y;

    const int minX = static_cast<int>(std::floor(left + kEdgeEpsilon));
    const int maxX = static_cast<int>(std::ceil(right - kEdgeEpsilon));
    const int minY = static_cast<int>(std::floor(top + kEdgeEpsilon));
    const int maxY = static_cast<int>(std::ceil(bottom - kEdgeEpsilon));

    PixelRect px;
    px.x = minX;
    px.y = minY;
    px.width = std::max(kMinCapturePixels, maxX - minX);
    px.height = std::max(kMinCapturePixels, maxY - minY);
    return px;
}

LogicalRect toTopLeftLogical(const PixelRect& px, Scale scale) {
    LogicalRect r;
    r.x = px.x / scale.x;
    r.y = px.y / scale.y;
    r.width = px.width / scale.x;
    r.height = px.height / scale.y;
    r.space = CoordSpace::ScreenLocal;
    return r;
}

LogicalRect snapToPixelGrid(const LogicalRect& r, Scale scale) {
    LogicalRect snapped = r;
    snapped.x = snapValue(r.x, scale.x);
    snapped.y = snapValue(r.y, scale.y);
    snapped.width = snapValue(r.width, scale.x);
    snapped.height = snapValue(r.height, scale.y);
    return snapped;
}

bool isOnPixelGrid(double v, double scale) {
    return onGrid(v, scale);
}

LogicalRect toGlobal(const LogicalRect& local, const Display& display) {
    requireSpace(local, CoordSpace::ScreenLocal, "toGlobal");
    LogicalRect global = local;
    global.x = shift(local.x, display.frame.x, display.scale.x);
    global.y = shift(local.y, display.frame.y, display.scale.y);
    global.space = CoordSpace::Global;
    return global;
}

LogicalRect toLocal(const LogicalRect& global, const Display& display) {
    requireSpace(global, CoordSpace::Global, "toLocal");
    LogicalRect local = global;
    local.x = shift(global.x, -display.frame.x, display.scale.x);
    local.y = shift(global.y, -display.frame.y, display.scale.y);
    local.space = CoordSpace::ScreenLocal;
    return local;
}

LogicalRect spanning(const LogicalPoint& a, const LogicalPoint& b) {
    LogicalRect r;
    r.x = std::min(a.x, b.x);
    r.y = std::min(a.y, b.y);
    r.width = std::fabs(a.x - b.x);
    r.height = std::fabs(a.y - b.y);
    r.space = CoordSpace::ScreenLocal;
    return r;
}

} // namespace PixelMath
