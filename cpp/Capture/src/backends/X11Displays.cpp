#include "backends/X11Displays.hpp"
#include "i3ipc.hpp"
#include <X11/Xlib.h>
#include <X11/Xresource.h>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace Capture {

namespace {

// Errors are reported on the thread whose request failed
thread_local int s_lastError = 0;

int onXError(Display* display, XErrorEvent* event) {
    char text[256] = {0};
    XGetErrorText(display, event->error_code, text, sizeof(text) - 1);
    std::cerr << "[X11] Protocol error: " << text << " (request " << static_cast<int>(event->request_code)
              << "." << static_cast<int>(event->minor_code) << ")" << std::endl;
    s_lastError = event->error_code;
    return 0;
}

} // namespace

void installX11ErrorHandler() {
    static std::once_flag once;
    std::call_once(once, [] {
        XInitThreads();
        XrmInitialize();
        XSetErrorHandler(onXError);
    });
}

int takeX11Error() {
    const int code = s_lastError;
    s_lastError = 0;
    return code;
}

double queryXftScale(Display* display) {
    installX11ErrorHandler();

    const char* resources = XResourceManagerString(display);
    if (!resources) {
        return 1.0;
    }

    double scale = 1.0;
    XrmDatabase db = XrmGetStringDatabase(resources);
    if (db) {
        char* type = nullptr;
        XrmValue value;
        if (XrmGetResource(db, "Xft.dpi", "Xft.Dpi", &type, &value) && value.addr) {
            const double dpi = std::atof(value.addr);
            if (dpi > 0.0) {
                scale = dpi / 96.0;
            }
        }
        XrmDestroyDatabase(db);
    }
    return scale;
}

PixelMath::DisplayLayout queryX11Layout(Display* display) {
    const double scale = queryXftScale(display);

    I3Ipc ipc;
    if (ipc.connected()) {
        std::vector<PixelMath::LayoutOutput> outputs = ipc.queryOutputs(scale);
        if (!outputs.empty()) {
            return PixelMath::DisplayLayout(outputs);
        }
    }

    // Plain X11: the default screen is the only display we know about
    const int screen = DefaultScreen(display);
    PixelMath::LayoutOutput out;
    out.name = "screen" + std::to_string(screen);
    out.pixelWidth = DisplayWidth(display, screen);
    out.pixelHeight = DisplayHeight(display, screen);
    out.scale = PixelMath::Scale{scale, scale};
    out.width = out.pixelWidth / scale;
    out.height = out.pixelHeight / scale;
    return PixelMath::DisplayLayout({out});
}

} // namespace Capture
