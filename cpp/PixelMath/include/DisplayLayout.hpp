#pragma once
#include "Geometry.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace PixelMath {

/**
 * @brief One output as a display server describes it: y-down, top-left origin
 */
struct LayoutOutput {
    std::string name;
    double x = 0.0;        // logical position in the server's layout space
    double y = 0.0;
    double width = 0.0;    // logical size
    double height = 0.0;
    int pixelWidth = 0;
    int pixelHeight = 0;
    Scale scale;
    int rootX = 0;         // top-left device pixel in the server's pixel space (X11 root window)
    int rootY = 0;
};

/**
 * @brief The set of connected displays in y-up global logical space
 *
 * Built fresh from each enumeration. Global y = 0 is the bottom edge of the
 * desktop's bounding box.
 */
class DisplayLayout {
public:
    DisplayLayout() = default;
    explicit DisplayLayout(const std::vector<LayoutOutput>& outputs);

    const std::vector<Display>& displays() const { return m_displays; }
    bool empty() const { return m_displays.empty(); }

    std::optional<Display> find(DisplayId id) const;
    std::optional<Display> displayAt(const LogicalPoint& global) const;

    // Server pixel position -> global logical point (on the display under it, else the first)
    LogicalPoint fromRootPixels(int px, int py) const;

    // Global logical rect -> server pixel rect, rounded edge by edge on the given display
    PixelRect toRootPixels(const LogicalRect& global, const Display& display) const;

    // Top-left device pixel of a display in server pixel space
    std::optional<std::pair<int, int>> rootOrigin(DisplayId id) const;

    // Stable identity for an output name (FNV-1a)
    static DisplayId idFor(const std::string& name);

private:
    struct Placement {
        DisplayId id;
        int rootX;
        int rootY;
    };

    const Placement* placementFor(DisplayId id) const;

    std::vector<Display> m_displays;
    std::vector<Placement> m_placements;
};

} // namespace PixelMath
