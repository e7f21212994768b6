#include "X11Toolkit.hpp"
#include "X11Windows.hpp"
#include <backends/X11Displays.hpp>
#include <X11/Xatom.h>
#include <X11/keysym.h>
#include <algorithm>
#include <iostream>
#include <sstream>

namespace Toolkit {

namespace {

constexpr int kControlWidth = 240;
constexpr int kControlHeight = 84;
constexpr int kPadding = 12;

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool isDeleteRequest(const XEvent& event, const X11Toolkit& toolkit) {
    return event.type == ClientMessage &&
           static_cast<unsigned long>(event.xclient.message_type) == toolkit.wmProtocols() &&
           static_cast<unsigned long>(event.xclient.data.l[0]) == toolkit.wmDeleteWindow();
}

} // namespace

/**
 * @brief Small window with a "Select Region" button and a status line
 *
 * Keys: s selects, q quits. Closing the window quits.
 */
class ControlWindow : public EventSink {
public:
    ControlWindow(X11Toolkit& toolkit, std::function<void()> onSelect, std::function<void()> onQuit)
        : m_toolkit(toolkit), m_x(toolkit.display()), m_onSelect(std::move(onSelect)), m_onQuit(std::move(onQuit)) {}

    ~ControlWindow() override {
        if (m_window) {
            m_toolkit.unregisterSink(m_window);
            XFreeGC(m_x, m_gc);
            XDestroyWindow(m_x, m_window);
            XFlush(m_x);
        }
    }

    bool create() {
        const int screen = DefaultScreen(m_x);
        m_window = XCreateSimpleWindow(m_x, RootWindow(m_x, screen), 0, 0, kControlWidth, kControlHeight, 0,
                                       BlackPixel(m_x, screen), WhitePixel(m_x, screen));
        if (!m_window) {
            std::cerr << "[X11] Failed to create control window" << std::endl;
            return false;
        }
        XSelectInput(m_x, m_window, ExposureMask | ButtonPressMask | KeyPressMask);
        m_toolkit.decorate(m_window, "RegionMirror");
        m_gc = XCreateGC(m_x, m_window, 0, nullptr);
        m_toolkit.registerSink(m_window, this);
        XMapRaised(m_x, m_window);
        XFlush(m_x);
        return true;
    }

    void setCapturing(bool capturing) {
        m_capturing = capturing;
        draw();
    }

    void handleEvent(const XEvent& event) override {
        switch (event.type) {
            case Expose:
                if (event.xexpose.count == 0) {
                    draw();
                }
                break;
            case ButtonPress:
                if (event.xbutton.button == Button1 && inButton(event.xbutton.x, event.xbutton.y)) {
                    m_onSelect();
                }
                break;
            case KeyPress: {
                XKeyEvent key = event.xkey;
                const KeySym sym = XLookupKeysym(&key, 0);
                if (sym == XK_s) {
                    m_onSelect();
                } else if (sym == XK_q) {
                    m_onQuit();
                }
                break;
            }
            case ClientMessage:
                if (isDeleteRequest(event, m_toolkit)) {
                    m_onQuit();
                }
                break;
            default:
                break;
        }
    }

private:
    bool inButton(int x, int y) const {
        return x >= kPadding && x < kControlWidth - kPadding && y >= kPadding && y < kPadding + 32;
    }

    void draw() {
        if (!m_window) {
            return;
        }
        const int screen = DefaultScreen(m_x);
        XClearWindow(m_x, m_window);
        XSetForeground(m_x, m_gc, BlackPixel(m_x, screen));
        XDrawRectangle(m_x, m_window, m_gc, kPadding, kPadding, kControlWidth - 2 * kPadding - 1, 31);

        const std::string label = "Select Region";
        XDrawString(m_x, m_window, m_gc, kPadding + 10, kPadding + 20, label.c_str(), static_cast<int>(label.size()));

        const std::string status = m_capturing ? "Mirroring" : "Idle";
        XDrawString(m_x, m_window, m_gc, kPadding, kControlHeight - kPadding, status.c_str(),
                    static_cast<int>(status.size()));
        XFlush(m_x);
    }

    X11Toolkit& m_toolkit;
    Display* m_x;
    std::function<void()> m_onSelect;
    std::function<void()> m_onQuit;
    Window m_window = 0;
    GC m_gc = nullptr;
    bool m_capturing = false;
};

X11Toolkit::X11Toolkit(int borderWidth)
    : m_borderWidth(borderWidth) {}

X11Toolkit::~X11Toolkit() {
    m_control.reset();
    if (m_display) {
        XCloseDisplay(m_display);
        m_display = nullptr;
    }
}

bool X11Toolkit::open() {
    Capture::installX11ErrorHandler();
    m_display = XOpenDisplay(nullptr);
    if (!m_display) {
        std::cerr << "[X11] Failed to open X11 display" << std::endl;
        return false;
    }
    m_wmProtocols = XInternAtom(m_display, "WM_PROTOCOLS", False);
    m_wmDeleteWindow = XInternAtom(m_display, "WM_DELETE_WINDOW", False);
    refreshLayout();
    return true;
}

int X11Toolkit::connectionFd() const {
    return m_display ? ConnectionNumber(m_display) : -1;
}

const PixelMath::DisplayLayout& X11Toolkit::refreshLayout() {
    m_layout = Capture::queryX11Layout(m_display);
    return m_layout;
}

void X11Toolkit::registerSink(unsigned long window, EventSink* sink) {
    m_sinks[window] = sink;
}

void X11Toolkit::unregisterSink(unsigned long window) {
    m_sinks.erase(window);
}

void X11Toolkit::decorate(unsigned long window, const std::string& title) const {
    XStoreName(m_display, window, title.c_str());

    const Atom netWmName = XInternAtom(m_display, "_NET_WM_NAME", False);
    const Atom utf8 = XInternAtom(m_display, "UTF8_STRING", False);
    XChangeProperty(m_display, window, netWmName, utf8, 8, PropModeReplace,
                    reinterpret_cast<const unsigned char*>(title.c_str()), static_cast<int>(title.size()));

    XClassHint* hint = XAllocClassHint();
    if (hint) {
        const std::string name = applicationId();
        std::string cls = "RegionMirror";
        hint->res_name = const_cast<char*>(name.c_str());
        hint->res_class = &cls[0];
        XSetClassHint(m_display, window, hint);
        XFree(hint);
    }

    Atom protocols[] = {static_cast<Atom>(m_wmDeleteWindow)};
    XSetWMProtocols(m_display, window, protocols, 1);
}

void X11Toolkit::dispatchEvents() {
    if (!m_display) {
        return;
    }
    while (XPending(m_display) > 0) {
        XEvent event;
        XNextEvent(m_display, &event);
        dispatch(event);
    }
}

void X11Toolkit::dispatch(XEvent& event) {
    auto it = m_sinks.find(event.xany.window);
    if (it != m_sinks.end()) {
        it->second->handleEvent(event);
    }
}

bool X11Toolkit::openControlWindow(std::function<void()> onSelect, std::function<void()> onQuit) {
    m_control = std::make_unique<ControlWindow>(*this, std::move(onSelect), std::move(onQuit));
    if (!m_control->create()) {
        m_control.reset();
        return false;
    }
    return true;
}

void X11Toolkit::setCapturing(bool capturing) {
    if (m_control) {
        m_control->setCapturing(capturing);
    }
}

PixelMath::LogicalPoint X11Toolkit::pointerLocation() const {
    Window rootReturn = 0;
    Window childReturn = 0;
    int rootX = 0;
    int rootY = 0;
    int winX = 0;
    int winY = 0;
    unsigned int mask = 0;
    if (!XQueryPointer(m_display, DefaultRootWindow(m_display), &rootReturn, &childReturn, &rootX, &rootY, &winX,
                       &winY, &mask)) {
        return m_layout.empty() ? PixelMath::LogicalPoint{} : m_layout.fromRootPixels(0, 0);
    }
    return m_layout.fromRootPixels(rootX, rootY);
}

std::unique_ptr<Session::IOverlayWindow> X11Toolkit::openOverlay(Selection::RegionSelector& selector) {
    refreshLayout();
    auto overlay = std::make_unique<OverlayWindow>(*this, selector);
    if (!overlay->create()) {
        return nullptr;
    }
    return overlay;
}

std::unique_ptr<Session::IMirrorWindow> X11Toolkit::openMirrorWindow(const PixelMath::Display& display,
                                                                     const PixelMath::LogicalSize& contentSize,
                                                                     Session::MirrorWindowEvents events) {
    refreshLayout();
    auto window = std::make_unique<MirrorWindow>(*this, display, contentSize, std::move(events));
    if (!window->create()) {
        return nullptr;
    }
    return window;
}

std::unique_ptr<Session::IBorderIndicator> X11Toolkit::showBorder(const PixelMath::LogicalRect& globalRegion) {
    auto border = std::make_unique<BorderIndicator>(*this, m_borderWidth, "orange red");
    if (!border->create()) {
        return nullptr;
    }
    border->moveTo(globalRegion);
    return border;
}

void X11Toolkit::showNotice(const std::string& message) {
    if (!m_display) {
        return;
    }

    const std::vector<std::string> lines = splitLines(message);
    const int lineHeight = 16;
    int width = 0;
    for (const std::string& line : lines) {
        width = std::max(width, static_cast<int>(line.size()) * 7);
    }
    width = std::min(720, width + 2 * kPadding);
    const int height = static_cast<int>(lines.size()) * lineHeight + 3 * kPadding + lineHeight;

    const int screen = DefaultScreen(m_display);
    const Window window = XCreateSimpleWindow(m_display, RootWindow(m_display, screen), 0, 0, width, height, 0,
                                              BlackPixel(m_display, screen), WhitePixel(m_display, screen));
    if (!window) {
        std::cerr << "[X11] Failed to create notice window" << std::endl;
        return;
    }
    XSelectInput(m_display, window, ExposureMask | ButtonPressMask | KeyPressMask);
    decorate(window, "RegionMirror");
    const GC gc = XCreateGC(m_display, window, 0, nullptr);
    XSetForeground(m_display, gc, BlackPixel(m_display, screen));
    XMapRaised(m_display, window);

    // Modal: only the notice consumes input until it is dismissed
    bool open = true;
    while (open) {
        XEvent event;
        XNextEvent(m_display, &event);
        if (event.xany.window != window) {
            if (event.type == Expose || event.type == ConfigureNotify) {
                dispatch(event);
            }
            continue;
        }
        switch (event.type) {
            case Expose: {
                int y = kPadding + lineHeight;
                for (const std::string& line : lines) {
                    XDrawString(m_display, window, gc, kPadding, y, line.c_str(), static_cast<int>(line.size()));
                    y += lineHeight;
                }
                const std::string hint = "(click or press any key)";
                XDrawString(m_display, window, gc, kPadding, y + kPadding, hint.c_str(),
                            static_cast<int>(hint.size()));
                break;
            }
            case ButtonPress:
            case KeyPress:
                open = false;
                break;
            case ClientMessage:
                open = !isDeleteRequest(event, *this);
                break;
            default:
                break;
        }
    }

    XFreeGC(m_display, gc);
    XDestroyWindow(m_display, window);
    XFlush(m_display);
}

} // namespace Toolkit
