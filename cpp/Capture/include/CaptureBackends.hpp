#pragma once
#include "ICaptureProvider.hpp"
#include <memory>
#include <string>

namespace Capture {

enum class BackendType {
    Auto,    // Detect from the environment
    X11,     // X11 root window grabs (pure X11 or XWayland)
    Wayland  // Native wlroots screencopy
};

// "auto" | "x11" | "wayland"; returns false for anything else
bool parseBackendType(const std::string& text, BackendType& out);
const char* toString(BackendType type);

// Resolves Auto to a compiled-in backend; explicit types pass through
BackendType detectBackend(BackendType requested);

/**
 * @brief Creates the provider for a resolved backend
 * @return nullptr if the backend was not compiled in
 */
std::unique_ptr<ICaptureProvider> createProvider(BackendType type, int failureBudget);
std::unique_ptr<IPermissionGate> createPermissionGate(BackendType type);

} // namespace Capture
