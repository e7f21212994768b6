#include "X11Windows.hpp"
#include <PixelMath.hpp>
#include <X11/cursorfont.h>
#include <X11/keysym.h>
#include <iostream>

namespace Toolkit {

namespace {

// Premultiplied ARGB
constexpr unsigned long kBaseDim = 0x40000000;      // 25% black before a drag
constexpr unsigned long kOutsideDim = 0x66000000;   // 40% black around the selection
constexpr unsigned long kClear = 0x00000000;
constexpr unsigned long kOutline = 0xffffffff;

} // namespace

OverlayWindow::OverlayWindow(X11Toolkit& toolkit, Selection::RegionSelector& selector)
    : m_toolkit(toolkit), m_selector(selector), m_x(toolkit.display()) {}

OverlayWindow::~OverlayWindow() {
    close();
}

bool OverlayWindow::create() {
    const PixelMath::Display& display = m_selector.display();
    const auto origin = m_toolkit.layout().rootOrigin(display.id);
    if (!origin) {
        std::cerr << "[X11] Display '" << display.name << "' is not in the current layout" << std::endl;
        return false;
    }

    const int screen = DefaultScreen(m_x);
    const Window root = RootWindow(m_x, screen);

    XVisualInfo vinfo;
    m_argb = XMatchVisualInfo(m_x, screen, 32, TrueColor, &vinfo);

    XSetWindowAttributes attrs;
    attrs.override_redirect = True;
    attrs.event_mask = ExposureMask | ButtonPressMask | ButtonReleaseMask | PointerMotionMask | KeyPressMask;

    if (m_argb) {
        m_colormap = XCreateColormap(m_x, root, vinfo.visual, AllocNone);
        attrs.colormap = m_colormap;
        attrs.background_pixel = kBaseDim;
        attrs.border_pixel = 0;
        m_window = XCreateWindow(m_x, root, origin->first, origin->second, display.pixelWidth, display.pixelHeight,
                                 0, vinfo.depth, InputOutput, vinfo.visual,
                                 CWColormap | CWBackPixel | CWBorderPixel | CWOverrideRedirect | CWEventMask, &attrs);
    } else {
        std::cout << "[X11] No 32-bit visual available; selection is shown as an outline only" << std::endl;
        m_window = XCreateWindow(m_x, root, origin->first, origin->second, display.pixelWidth, display.pixelHeight,
                                 0, 0, InputOnly, CopyFromParent, CWOverrideRedirect | CWEventMask, &attrs);
    }
    if (!m_window) {
        std::cerr << "[X11] Failed to create selection overlay" << std::endl;
        return false;
    }

    if (m_argb) {
        m_gc = XCreateGC(m_x, m_window, 0, nullptr);
        XSetLineAttributes(m_x, m_gc, 1, LineSolid, CapButt, JoinMiter);
    } else {
        m_outline = std::make_unique<BorderIndicator>(m_toolkit, 1, "white");
        if (!m_outline->create()) {
            m_outline.reset();
        }
    }

    m_toolkit.registerSink(m_window, this);
    m_cursor = XCreateFontCursor(m_x, XC_crosshair);
    XMapRaised(m_x, m_window);
    XSync(m_x, False);

    const int pointer = XGrabPointer(m_x, m_window, False, ButtonPressMask | ButtonReleaseMask | PointerMotionMask,
                                     GrabModeAsync, GrabModeAsync, None, m_cursor, CurrentTime);
    const int keyboard = XGrabKeyboard(m_x, m_window, False, GrabModeAsync, GrabModeAsync, CurrentTime);
    m_grabbed = true;
    if (pointer != GrabSuccess || keyboard != GrabSuccess) {
        std::cerr << "[X11] Could not grab " << (pointer != GrabSuccess ? "pointer" : "keyboard")
                  << "; another client holds it" << std::endl;
    }

    m_selector.setFeedbackCallback([this](const Selection::HoleMask&) { redraw(); });
    std::cout << "[X11] Drag to select a region, Escape to cancel" << std::endl;
    return true;
}

void OverlayWindow::close() {
    if (!m_window) {
        return;
    }
    m_selector.setFeedbackCallback(nullptr);
    if (m_grabbed) {
        XUngrabPointer(m_x, CurrentTime);
        XUngrabKeyboard(m_x, CurrentTime);
        m_grabbed = false;
    }
    m_outline.reset();
    m_toolkit.unregisterSink(m_window);
    if (m_gc) {
        XFreeGC(m_x, m_gc);
        m_gc = nullptr;
    }
    XDestroyWindow(m_x, m_window);
    m_window = 0;
    if (m_colormap) {
        XFreeColormap(m_x, m_colormap);
        m_colormap = 0;
    }
    if (m_cursor) {
        XFreeCursor(m_x, m_cursor);
        m_cursor = 0;
    }
    XFlush(m_x);
}

PixelMath::LogicalPoint OverlayWindow::toLocal(int x, int y) const {
    // Window pixels are top-left; the selector works y-up in logical units
    const PixelMath::Display& display = m_selector.display();
    return PixelMath::LogicalPoint{x / display.scale.x, display.frame.height - y / display.scale.y};
}

void OverlayWindow::handleEvent(const XEvent& event) {
    if (m_selector.isFinished()) {
        return;
    }

    switch (event.type) {
        case Expose:
            if (event.xexpose.count == 0) {
                redraw();
            }
            break;
        case ButtonPress:
            if (event.xbutton.button == Button1) {
                m_selector.pointerDown(toLocal(event.xbutton.x, event.xbutton.y));
                redraw();
            }
            break;
        case MotionNotify:
            m_selector.pointerMove(toLocal(event.xmotion.x, event.xmotion.y));
            break;
        case ButtonRelease:
            if (event.xbutton.button == Button1) {
                m_selector.pointerUp(toLocal(event.xbutton.x, event.xbutton.y));
            }
            break;
        case KeyPress: {
            XKeyEvent key = event.xkey;
            if (XLookupKeysym(&key, 0) == XK_Escape) {
                m_selector.cancel();
            }
            break;
        }
        default:
            break;
    }
}

void OverlayWindow::redraw() {
    const Selection::HoleMask& mask = m_selector.mask();
    const bool dragging = m_selector.state() == Selection::SelectorState::Dragging;

    if (!m_argb) {
        if (m_outline && dragging) {
            m_outline->moveTo(PixelMath::toGlobal(mask.hole, m_selector.display()));
        }
        return;
    }

    const PixelMath::Display& display = m_selector.display();
    if (!dragging) {
        XSetForeground(m_x, m_gc, kBaseDim);
        XFillRectangle(m_x, m_window, m_gc, 0, 0, display.pixelWidth, display.pixelHeight);
        XFlush(m_x);
        return;
    }

    XSetForeground(m_x, m_gc, kOutsideDim);
    for (const PixelMath::LogicalRect& rect : mask.dimmedRects()) {
        const XRectangle r = toWindowPixels(rect, display);
        XFillRectangle(m_x, m_window, m_gc, r.x, r.y, r.width, r.height);
    }

    const XRectangle hole = toWindowPixels(mask.hole, display);
    XSetForeground(m_x, m_gc, kClear);
    XFillRectangle(m_x, m_window, m_gc, hole.x, hole.y, hole.width, hole.height);
    if (hole.width > 1 && hole.height > 1) {
        XSetForeground(m_x, m_gc, kOutline);
        XDrawRectangle(m_x, m_window, m_gc, hole.x, hole.y, hole.width - 1, hole.height - 1);
    }
    XFlush(m_x);
}

} // namespace Toolkit
