#pragma once
#include <cstdint>
#include <string>

namespace PixelMath {

// Logical space is y-up: the origin sits at the bottom-left of a screen
// (ScreenLocal) or of the virtual desktop (Global).
enum class CoordSpace {
    ScreenLocal,
    Global
};

struct Scale {
    double x = 1.0; // device pixels per logical unit, horizontal
    double y = 1.0; // device pixels per logical unit, vertical

    bool isHighDensity() const { return x > 1.0 || y > 1.0; }
};

struct LogicalPoint {
    double x = 0.0;
    double y = 0.0;
};

struct LogicalSize {
    double width = 0.0;
    double height = 0.0;
};

struct LogicalRect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    CoordSpace space = CoordSpace::ScreenLocal;

    double maxX() const { return x + width; }
    double maxY() const { return y + height; }
    bool contains(const LogicalPoint& p) const {
        return p.x >= x && p.x < maxX() && p.y >= y && p.y < maxY();
    }
};

bool operator==(const LogicalRect& a, const LogicalRect& b);
bool operator!=(const LogicalRect& a, const LogicalRect& b);

// Integer device pixels, top-left origin.
struct PixelRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

bool operator==(const PixelRect& a, const PixelRect& b);
bool operator!=(const PixelRect& a, const PixelRect& b);

using DisplayId = std::uint64_t;

struct Display {
    DisplayId id = 0;
    std::string name;         // connector / output name ("DP-1"), informational
    LogicalRect frame;        // Global space
    int pixelWidth = 0;
    int pixelHeight = 0;
    Scale scale;
};

std::string toString(const LogicalRect& r);
std::string toString(const PixelRect& r);

} // namespace PixelMath
