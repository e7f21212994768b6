#include "CaptureBackends.hpp"
#include "i3ipc.hpp"

#ifdef X11_BACKEND_ENABLED
#include "backends/XShmCaptureProvider.hpp"
#endif

#ifdef WAYLAND_BACKEND_ENABLED
#include "backends/ScreencopyCaptureProvider.hpp"
#endif

#include <iostream>

namespace Capture {

bool parseBackendType(const std::string& text, BackendType& out) {
    if (text == "auto") {
        out = BackendType::Auto;
    } else if (text == "x11" || text == "xwayland") {
        out = BackendType::X11;
    } else if (text == "wayland") {
        out = BackendType::Wayland;
    } else {
        return false;
    }
    return true;
}

const char* toString(BackendType type) {
    switch (type) {
        case BackendType::Auto: return "Auto";
        case BackendType::X11: return "X11";
        case BackendType::Wayland: return "Wayland";
    }
    return "Unknown";
}

BackendType detectBackend(BackendType requested) {
    if (requested != BackendType::Auto) {
        return requested;
    }

    // Key on the session, not on DISPLAY: XWayland sets DISPLAY on every Wayland desktop
    const DisplayServer server = I3Ipc::detectDisplayServer();
    if (isWaylandSession(server)) {
        #ifdef WAYLAND_BACKEND_ENABLED
        std::cout << "[Capture] Wayland session detected - using Wayland backend" << std::endl;
        return BackendType::Wayland;
        #else
        std::cerr << "[Capture] Wayland session detected but the Wayland backend is not compiled, "
                  << "falling back to XWayland root grabs" << std::endl;
        #endif
    } else if (server == DisplayServer::X11 || server == DisplayServer::I3) {
        std::cout << "[Capture] X11 session detected - using X11 backend" << std::endl;
    }

    #ifdef X11_BACKEND_ENABLED
    if (server == DisplayServer::Unknown) {
        std::cout << "[Capture] Could not detect environment - defaulting to X11" << std::endl;
    }
    return BackendType::X11;
    #elif defined(WAYLAND_BACKEND_ENABLED)
    std::cout << "[Capture] X11 backend not available - defaulting to Wayland" << std::endl;
    return BackendType::Wayland;
    #else
    std::cerr << "[Capture] No backends available!" << std::endl;
    return BackendType::Auto;
    #endif
}

std::unique_ptr<ICaptureProvider> createProvider(BackendType type, int failureBudget) {
    switch (type) {
        case BackendType::X11:
            #ifdef X11_BACKEND_ENABLED
            std::cout << "[Capture] Creating X11 provider" << std::endl;
            return std::make_unique<XShmCaptureProvider>(failureBudget);
            #else
            std::cerr << "[Capture] X11 backend not compiled!" << std::endl;
            std::cerr << "[Capture] Install libx11-dev and libxext-dev, then rebuild" << std::endl;
            return nullptr;
            #endif

        case BackendType::Wayland:
            #ifdef WAYLAND_BACKEND_ENABLED
            std::cout << "[Capture] Creating Wayland provider" << std::endl;
            return std::make_unique<ScreencopyCaptureProvider>(failureBudget);
            #else
            std::cerr << "[Capture] Wayland backend not compiled!" << std::endl;
            std::cerr << "[Capture] Install libwayland-dev and wlr-protocols, then rebuild" << std::endl;
            return nullptr;
            #endif

        case BackendType::Auto: {
            std::cerr << "[Capture] Auto backend should have been resolved!" << std::endl;
            const BackendType resolved = detectBackend(BackendType::Auto);
            return resolved == BackendType::Auto ? nullptr : createProvider(resolved, failureBudget);
        }
    }
    return nullptr;
}

std::unique_ptr<IPermissionGate> createPermissionGate(BackendType type) {
    switch (type) {
        case BackendType::X11:
            #ifdef X11_BACKEND_ENABLED
            return std::make_unique<X11PermissionGate>();
            #else
            return nullptr;
            #endif

        case BackendType::Wayland:
            #ifdef WAYLAND_BACKEND_ENABLED
            return std::make_unique<WaylandPermissionGate>();
            #else
            return nullptr;
            #endif

        case BackendType::Auto: {
            const BackendType resolved = detectBackend(BackendType::Auto);
            return resolved == BackendType::Auto ? nullptr : createPermissionGate(resolved);
        }
    }
    return nullptr;
}

} // namespace Capture
