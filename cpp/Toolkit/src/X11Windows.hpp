#pragma once
#include "X11Toolkit.hpp"
#include <RegionSelector.hpp>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Toolkit {

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void handleEvent(const XEvent& event) = 0;
};

// Device pixel rect of a local (y-up) logical rect inside a window covering the display
XRectangle toWindowPixels(const PixelMath::LogicalRect& local, const PixelMath::Display& display);

/**
 * @brief Four click-through override-redirect windows framing a rect from outside
 */
class BorderIndicator : public Session::IBorderIndicator {
public:
    BorderIndicator(X11Toolkit& toolkit, int width, const char* color);
    ~BorderIndicator() override;

    bool create();
    void moveTo(const PixelMath::LogicalRect& globalRegion) override;

private:
    X11Toolkit& m_toolkit;
    Display* m_x;
    int m_width;
    std::string m_color;
    Window m_edges[4] = {0, 0, 0, 0};
};

/**
 * @brief Full-display selection overlay feeding a RegionSelector
 *
 * Uses a 32-bit ARGB visual to dim around the selection when the server has
 * one. Without it the overlay is input-only and the selection is outlined by
 * a BorderIndicator.
 */
class OverlayWindow : public Session::IOverlayWindow, public EventSink {
public:
    OverlayWindow(X11Toolkit& toolkit, Selection::RegionSelector& selector);
    ~OverlayWindow() override;

    bool create();
    void close() override;
    void handleEvent(const XEvent& event) override;

private:
    PixelMath::LogicalPoint toLocal(int x, int y) const;
    void redraw();

    X11Toolkit& m_toolkit;
    Selection::RegionSelector& m_selector;
    Display* m_x;
    Window m_window = 0;
    GC m_gc = nullptr;
    Colormap m_colormap = 0;
    Cursor m_cursor = 0;
    bool m_argb = false;
    bool m_grabbed = false;
    std::unique_ptr<BorderIndicator> m_outline;
};

/**
 * @brief Top-level window hosting the mirrored frames at 1:1 device pixels
 */
class MirrorWindow : public Session::IMirrorWindow, public EventSink {
public:
    MirrorWindow(X11Toolkit& toolkit, const PixelMath::Display& display, const PixelMath::LogicalSize& contentSize,
                 Session::MirrorWindowEvents events);
    ~MirrorWindow() override;

    bool create();

    PixelMath::Scale displayScale() const override { return m_display.scale; }
    PixelMath::LogicalSize contentSize() const override;
    void setContentScale(double scale) override;
    void setResizeIncrements(const PixelMath::LogicalSize& increments) override;
    void setImplicitAnimationsEnabled(bool enabled) override;
    void present(const IMGBuffer::Buffer& frame, const Render::RenderSurface& surface) override;
    void clear() override;
    void close() override;

    void handleEvent(const XEvent& event) override;

private:
    void repaint(bool clearFirst);
    void updateHints();
    void releaseImage();
    bool checkDisplay();

    X11Toolkit& m_toolkit;
    Display* m_x;
    PixelMath::Display m_display;
    Session::MirrorWindowEvents m_events;

    Window m_window = 0;
    GC m_gc = nullptr;
    int m_width = 0;  // device pixels
    int m_height = 0;
    int m_aspectWidth = 0;
    int m_aspectHeight = 0;
    PixelMath::LogicalSize m_increments{1.0, 1.0};

    std::vector<char> m_pixels;
    XImage* m_image = nullptr;
    int m_offsetX = 0;
    int m_offsetY = 0;
};

} // namespace Toolkit
