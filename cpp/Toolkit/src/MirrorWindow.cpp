#include "X11Windows.hpp"
#include <PixelMath.hpp>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>

namespace Toolkit {

MirrorWindow::MirrorWindow(X11Toolkit& toolkit, const PixelMath::Display& display,
                           const PixelMath::LogicalSize& contentSize, Session::MirrorWindowEvents events)
    : m_toolkit(toolkit), m_x(toolkit.display()), m_display(display), m_events(std::move(events)) {
    m_width = std::max(1, static_cast<int>(std::lround(contentSize.width * display.scale.x)));
    m_height = std::max(1, static_cast<int>(std::lround(contentSize.height * display.scale.y)));
    m_aspectWidth = m_width;
    m_aspectHeight = m_height;
}

MirrorWindow::~MirrorWindow() {
    close();
}

bool MirrorWindow::create() {
    const int screen = DefaultScreen(m_x);
    const Window root = RootWindow(m_x, screen);

    // Centered on the display the region came from
    int x = 0;
    int y = 0;
    if (const auto origin = m_toolkit.layout().rootOrigin(m_display.id)) {
        x = origin->first + (m_display.pixelWidth - m_width) / 2;
        y = origin->second + (m_display.pixelHeight - m_height) / 2;
    }

    m_window = XCreateSimpleWindow(m_x, root, x, y, m_width, m_height, 0, BlackPixel(m_x, screen),
                                   BlackPixel(m_x, screen));
    if (!m_window) {
        std::cerr << "[X11] Failed to create mirror window" << std::endl;
        return false;
    }

    XSelectInput(m_x, m_window, ExposureMask | StructureNotifyMask);
    m_toolkit.decorate(m_window, "RegionMirror");
    m_gc = XCreateGC(m_x, m_window, 0, nullptr);
    updateHints();

    m_toolkit.registerSink(m_window, this);
    XMapRaised(m_x, m_window);
    XFlush(m_x);

    std::cout << "[X11] Mirror window " << m_width << "x" << m_height << " px on '" << m_display.name << "'"
              << std::endl;
    return true;
}

PixelMath::LogicalSize MirrorWindow::contentSize() const {
    return PixelMath::LogicalSize{m_width / m_display.scale.x, m_height / m_display.scale.y};
}

void MirrorWindow::setContentScale(double scale) {
    // X11 windows have no backing scale of their own; the store is already device pixels
    if (scale != 1.0) {
        std::cerr << "[X11] Ignoring content scale " << scale << ", frames are shown 1:1" << std::endl;
    }
}

void MirrorWindow::setResizeIncrements(const PixelMath::LogicalSize& increments) {
    m_increments = increments;
    if (m_window) {
        updateHints();
    }
}

void MirrorWindow::setImplicitAnimationsEnabled(bool) {
    // Xlib draws synchronously; there is nothing to animate
}

void MirrorWindow::updateHints() {
    XSizeHints* hints = XAllocSizeHints();
    if (!hints) {
        return;
    }
    hints->flags = PResizeInc | PAspect | PMinSize | PBaseSize;
    hints->width_inc = std::max(1, static_cast<int>(std::lround(m_increments.width * m_display.scale.x)));
    hints->height_inc = std::max(1, static_cast<int>(std::lround(m_increments.height * m_display.scale.y)));
    hints->base_width = 0;
    hints->base_height = 0;
    hints->min_width = PixelMath::kMinCapturePixels;
    hints->min_height = PixelMath::kMinCapturePixels;
    hints->min_aspect.x = m_aspectWidth;
    hints->min_aspect.y = m_aspectHeight;
    hints->max_aspect.x = m_aspectWidth;
    hints->max_aspect.y = m_aspectHeight;
    XSetWMNormalHints(m_x, m_window, hints);
    XFree(hints);
}

void MirrorWindow::present(const IMGBuffer::Buffer& frame, const Render::RenderSurface& surface) {
    if (!m_window) {
        return;
    }

    const int w = static_cast<int>(frame.width());
    const int h = static_cast<int>(frame.height());
    const bool geometryChanged = !m_image || m_image->width != w || m_image->height != h ||
                                 surface.offsetPixelsX != m_offsetX || surface.offsetPixelsY != m_offsetY;

    if (!m_image || m_image->width != w || m_image->height != h) {
        releaseImage();
        m_pixels.assign(frame.stride() * frame.height(), 0);
        const int screen = DefaultScreen(m_x);
        m_image = XCreateImage(m_x, DefaultVisual(m_x, screen), DefaultDepth(m_x, screen), ZPixmap, 0,
                               m_pixels.data(), w, h, 32, static_cast<int>(frame.stride()));
        if (!m_image) {
            std::cerr << "[X11] Failed to create " << w << "x" << h << " image" << std::endl;
            return;
        }
    }

    std::memcpy(m_pixels.data(), frame.data(), m_pixels.size());
    if (frame.format() == IMGBuffer::PixelFormat::RGBA8) {
        // Visuals we draw into are BGRA in memory
        for (std::size_t i = 0; i + 3 < m_pixels.size(); i += 4) {
            std::swap(m_pixels[i], m_pixels[i + 2]);
        }
    }

    m_offsetX = surface.offsetPixelsX;
    m_offsetY = surface.offsetPixelsY;
    repaint(geometryChanged);
}

void MirrorWindow::repaint(bool clearFirst) {
    if (clearFirst) {
        XClearWindow(m_x, m_window);
    }
    if (m_image) {
        XPutImage(m_x, m_window, m_gc, m_image, 0, 0, m_offsetX, m_offsetY, m_image->width, m_image->height);
    }
    XFlush(m_x);
}

void MirrorWindow::clear() {
    releaseImage();
    if (m_window) {
        XClearWindow(m_x, m_window);
        XFlush(m_x);
    }
}

void MirrorWindow::releaseImage() {
    if (m_image) {
        // Pixels are owned by m_pixels
        m_image->data = nullptr;
        XDestroyImage(m_image);
        m_image = nullptr;
    }
}

void MirrorWindow::close() {
    if (!m_window) {
        return;
    }
    releaseImage();
    m_toolkit.unregisterSink(m_window);
    if (m_gc) {
        XFreeGC(m_x, m_gc);
        m_gc = nullptr;
    }
    XDestroyWindow(m_x, m_window);
    m_window = 0;
    XFlush(m_x);
}

bool MirrorWindow::checkDisplay() {
    int rootX = 0;
    int rootY = 0;
    Window child = 0;
    if (!XTranslateCoordinates(m_x, m_window, DefaultRootWindow(m_x), 0, 0, &rootX, &rootY, &child)) {
        return false;
    }

    const PixelMath::DisplayLayout& layout = m_toolkit.layout();
    const PixelMath::LogicalPoint center = layout.fromRootPixels(rootX + m_width / 2, rootY + m_height / 2);
    const std::optional<PixelMath::Display> now = layout.displayAt(center);
    if (!now) {
        return false;
    }
    if (now->id == m_display.id && now->scale.x == m_display.scale.x && now->scale.y == m_display.scale.y) {
        return false;
    }

    std::cout << "[X11] Mirror window moved to '" << now->name << "' (scale " << now->scale.x << ")" << std::endl;
    m_display = *now;
    updateHints();
    return true;
}

void MirrorWindow::handleEvent(const XEvent& event) {
    switch (event.type) {
        case Expose:
            if (event.xexpose.count == 0) {
                repaint(true);
            }
            break;
        case ConfigureNotify: {
            if (checkDisplay() && m_events.onDisplayChanged) {
                m_events.onDisplayChanged();
            }
            const XConfigureEvent& cfg = event.xconfigure;
            if (cfg.width != m_width || cfg.height != m_height) {
                m_width = cfg.width;
                m_height = cfg.height;
                if (m_events.onResize) {
                    m_events.onResize(contentSize());
                }
                repaint(true);
            }
            break;
        }
        case ClientMessage:
            if (static_cast<unsigned long>(event.xclient.message_type) == m_toolkit.wmProtocols() &&
                static_cast<unsigned long>(event.xclient.data.l[0]) == m_toolkit.wmDeleteWindow()) {
                if (m_events.onCloseRequested) {
                    m_events.onCloseRequested();
                }
            }
            break;
        default:
            break;
    }
}

} // namespace Toolkit
