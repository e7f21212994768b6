#include "X11Windows.hpp"
#include <X11/extensions/shape.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace Toolkit {

XRectangle toWindowPixels(const PixelMath::LogicalRect& local, const PixelMath::Display& display) {
    // Round edges, not sizes, so neighbouring rects meet exactly
    const double h = display.frame.height;
    const long x0 = std::lround(local.x * display.scale.x);
    const long x1 = std::lround(local.maxX() * display.scale.x);
    const long y0 = std::lround((h - local.maxY()) * display.scale.y);
    const long y1 = std::lround((h - local.y) * display.scale.y);

    XRectangle r;
    r.x = static_cast<short>(x0);
    r.y = static_cast<short>(y0);
    r.width = static_cast<unsigned short>(std::max(0L, x1 - x0));
    r.height = static_cast<unsigned short>(std::max(0L, y1 - y0));
    return r;
}

BorderIndicator::BorderIndicator(X11Toolkit& toolkit, int width, const char* color)
    : m_toolkit(toolkit), m_x(toolkit.display()), m_width(std::max(1, width)), m_color(color) {}

BorderIndicator::~BorderIndicator() {
    for (Window& edge : m_edges) {
        if (edge) {
            XDestroyWindow(m_x, edge);
            edge = 0;
        }
    }
    XFlush(m_x);
}

bool BorderIndicator::create() {
    const int screen = DefaultScreen(m_x);
    const Window root = RootWindow(m_x, screen);

    XColor color;
    XColor exact;
    unsigned long pixel = WhitePixel(m_x, screen);
    if (XAllocNamedColor(m_x, DefaultColormap(m_x, screen), m_color.c_str(), &color, &exact)) {
        pixel = color.pixel;
    } else {
        std::cerr << "[X11] Unknown border color '" << m_color << "', using white" << std::endl;
    }

    XSetWindowAttributes attrs;
    attrs.override_redirect = True;
    attrs.background_pixel = pixel;
    attrs.border_pixel = 0;

    for (Window& edge : m_edges) {
        edge = XCreateWindow(m_x, root, 0, 0, 1, 1, 0, CopyFromParent, InputOutput, CopyFromParent,
                             CWOverrideRedirect | CWBackPixel | CWBorderPixel, &attrs);
        if (!edge) {
            std::cerr << "[X11] Failed to create border window" << std::endl;
            return false;
        }
        // Empty input shape: clicks fall through to whatever is below
        XShapeCombineRectangles(m_x, edge, ShapeInput, 0, 0, nullptr, 0, ShapeSet, Unsorted);
    }
    return true;
}

void BorderIndicator::moveTo(const PixelMath::LogicalRect& globalRegion) {
    const PixelMath::DisplayLayout& layout = m_toolkit.layout();
    const PixelMath::LogicalPoint center{globalRegion.x + globalRegion.width / 2.0,
                                         globalRegion.y + globalRegion.height / 2.0};
    std::optional<PixelMath::Display> display = layout.displayAt(center);
    if (!display && !layout.empty()) {
        display = layout.displays().front();
    }
    if (!display) {
        return;
    }

    const PixelMath::PixelRect r = layout.toRootPixels(globalRegion, *display);
    const int w = m_width;
    const XRectangle frames[4] = {
        {static_cast<short>(r.x - w), static_cast<short>(r.y - w), static_cast<unsigned short>(r.width + 2 * w),
         static_cast<unsigned short>(w)},
        {static_cast<short>(r.x - w), static_cast<short>(r.y + r.height), static_cast<unsigned short>(r.width + 2 * w),
         static_cast<unsigned short>(w)},
        {static_cast<short>(r.x - w), static_cast<short>(r.y), static_cast<unsigned short>(w),
         static_cast<unsigned short>(std::max(1, r.height))},
        {static_cast<short>(r.x + r.width), static_cast<short>(r.y), static_cast<unsigned short>(w),
         static_cast<unsigned short>(std::max(1, r.height))},
    };

    for (int i = 0; i < 4; ++i) {
        if (!m_edges[i]) {
            continue;
        }
        XMoveResizeWindow(m_x, m_edges[i], frames[i].x, frames[i].y, std::max<unsigned>(1, frames[i].width),
                          std::max<unsigned>(1, frames[i].height));
        XMapRaised(m_x, m_edges[i]);
    }
    XFlush(m_x);
}

} // namespace Toolkit
