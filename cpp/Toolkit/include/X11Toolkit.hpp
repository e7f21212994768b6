#pragma once
#include <DisplayLayout.hpp>
#include <IWindowToolkit.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>

struct _XDisplay;
union _XEvent;

namespace Toolkit {

class EventSink;
class ControlWindow;

/**
 * @brief Xlib implementation of the orchestrator's windowing needs
 *
 * All windows live on one X connection owned by the control thread. The
 * caller polls connectionFd() and calls dispatchEvents() when it is readable.
 */
class X11Toolkit : public Session::IWindowToolkit {
public:
    explicit X11Toolkit(int borderWidth = 2);
    ~X11Toolkit() override;

    X11Toolkit(const X11Toolkit&) = delete;
    X11Toolkit& operator=(const X11Toolkit&) = delete;

    // Connects to $DISPLAY; false if the server is unreachable
    bool open();
    int connectionFd() const;

    // Routes every queued X event to the window it belongs to
    void dispatchEvents();

    bool openControlWindow(std::function<void()> onSelect, std::function<void()> onQuit);
    void setCapturing(bool capturing);

    PixelMath::LogicalPoint pointerLocation() const override;
    std::unique_ptr<Session::IOverlayWindow> openOverlay(Selection::RegionSelector& selector) override;
    std::unique_ptr<Session::IMirrorWindow> openMirrorWindow(const PixelMath::Display& display,
                                                             const PixelMath::LogicalSize& contentSize,
                                                             Session::MirrorWindowEvents events) override;
    std::unique_ptr<Session::IBorderIndicator> showBorder(const PixelMath::LogicalRect& globalRegion) override;
    void showNotice(const std::string& message) override;
    std::string applicationId() const override { return "regionmirror"; }

    _XDisplay* display() const { return m_display; }
    const PixelMath::DisplayLayout& layout() const { return m_layout; }
    const PixelMath::DisplayLayout& refreshLayout();

    void registerSink(unsigned long window, EventSink* sink);
    void unregisterSink(unsigned long window);

    // Atoms shared by all top-level windows
    unsigned long wmProtocols() const { return m_wmProtocols; }
    unsigned long wmDeleteWindow() const { return m_wmDeleteWindow; }

    // WM_NAME, _NET_WM_NAME, WM_CLASS and WM_DELETE_WINDOW for a top-level window
    void decorate(unsigned long window, const std::string& title) const;

private:
    void dispatch(_XEvent& event);

    _XDisplay* m_display = nullptr;
    int m_borderWidth;
    PixelMath::DisplayLayout m_layout;
    std::map<unsigned long, EventSink*> m_sinks;
    unsigned long m_wmProtocols = 0;
    unsigned long m_wmDeleteWindow = 0;
    std::unique_ptr<ControlWindow> m_control;
};

} // namespace Toolkit
