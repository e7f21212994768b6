#include "DisplayLayout.hpp"
#include <algorithm>
#include <cmath>

namespace PixelMath {

DisplayLayout::DisplayLayout(const std::vector<LayoutOutput>& outputs) {
    double bottom = 0.0;
    for (const auto& o : outputs) {
        bottom = std::max(bottom, o.y + o.height);
    }

    for (const auto& o : outputs) {
        Display d;
        d.id = idFor(o.name);
        d.name = o.name;
        d.frame = LogicalRect{o.x, bottom - (o.y + o.height), o.width, o.height, CoordSpace::Global};
        d.pixelWidth = o.pixelWidth;
        d.pixelHeight = o.pixelHeight;
        d.scale = o.scale;
        m_displays.push_back(d);
        m_placements.push_back(Placement{d.id, o.rootX, o.rootY});
    }
}

DisplayId DisplayLayout::idFor(const std::string& name) {
    std::uint64_t hash = 14695981039346656037ull;
    for (unsigned char c : name) {
        hash ^= c;
        hash *= 1099511628211ull;
    }
    return hash;
}

const DisplayLayout::Placement* DisplayLayout::placementFor(DisplayId id) const {
    for (const auto& p : m_placements) {
        if (p.id == id) {
            return &p;
        }
    }
    return nullptr;
}

std::optional<Display> DisplayLayout::find(DisplayId id) const {
    for (const auto& d : m_displays) {
        if (d.id == id) {
            return d;
        }
    }
    return std::nullopt;
}

std::optional<Display> DisplayLayout::displayAt(const LogicalPoint& global) const {
    for (const auto& d : m_displays) {
        if (d.frame.contains(global)) {
            return d;
        }
    }
    return std::nullopt;
}

std::optional<std::pair<int, int>> DisplayLayout::rootOrigin(DisplayId id) const {
    if (const Placement* p = placementFor(id)) {
        return std::make_pair(p->rootX, p->rootY);
    }
    return std::nullopt;
}

LogicalPoint DisplayLayout::fromRootPixels(int px, int py) const {
    if (m_displays.empty()) {
        return LogicalPoint{static_cast<double>(px), static_cast<double>(py)};
    }

    std::size_t index = 0;
    for (std::size_t i = 0; i < m_displays.size(); ++i) {
        const Placement& p = m_placements[i];
        const Display& d = m_displays[i];
        if (px >= p.rootX && px < p.rootX + d.pixelWidth && py >= p.rootY && py < p.rootY + d.pixelHeight) {
            index = i;
            break;
        }
    }

    const Display& d = m_displays[index];
    const Placement& p = m_placements[index];
    const double localX = (px - p.rootX) / d.scale.x;
    const double localYDown = (py - p.rootY) / d.scale.y;
    return LogicalPoint{d.frame.x + localX, d.frame.maxY() - localYDown};
}

PixelRect DisplayLayout::toRootPixels(const LogicalRect& global, const Display& display) const {
    const Placement* p = placementFor(display.id);
    const int originX = p ? p->rootX : 0;
    const int originY = p ? p->rootY : 0;

    const long left = std::lround((global.x - display.frame.x) * display.scale.x);
    const long right = std::lround((global.maxX() - display.frame.x) * display.scale.x);
    const long top = std::lround((display.frame.maxY() - global.maxY()) * display.scale.y);
    const long bottom = std::lround((display.frame.maxY() - global.y) * display.scale.y);

    PixelRect r;
    r.x = originX + static_cast<int>(left);
    r.y = originY + static_cast<int>(top);
    r.width = static_cast<int>(right - left);
    r.height = static_cast<int>(bottom - top);
    return r;
}

} // namespace PixelMath
