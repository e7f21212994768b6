#pragma once
#include "ICaptureProvider.hpp"

#ifdef WAYLAND_BACKEND_ENABLED

#include <map>
#include <memory>
#include <mutex>

namespace Capture {

/**
 * @brief Capture provider for wlroots compositors (Sway, Hyprland, ...)
 *
 * Uses wlr-screencopy-unstable-v1. Every session owns a thread with its own
 * wl_display connection and requests one capture_output_region frame per tick.
 */
class ScreencopyCaptureProvider : public ICaptureProvider {
public:
    explicit ScreencopyCaptureProvider(int failureBudget = 10);
    ~ScreencopyCaptureProvider() override;

    std::string name() const override { return "Wayland/wlr-screencopy"; }

    std::vector<PixelMath::Display> enumerateDisplays() override;

    std::future<ProviderHandle> startSession(const PixelMath::Display& display,
                                             const CaptureDescriptor& descriptor,
                                             const std::set<std::string>& exclusions,
                                             FrameCallback onFrame,
                                             ErrorCallback onError) override;

    std::future<void> stopSession(ProviderHandle handle) override;

private:
    struct Stream;

    static void run(std::shared_ptr<Stream> stream, std::promise<ProviderHandle> started);
    static void halt(Stream& stream);

    int m_failureBudget;

    std::mutex m_mutex;
    std::map<ProviderHandle, std::shared_ptr<Stream>> m_streams;
    ProviderHandle m_nextHandle = 1;
};

/**
 * @brief Capture is possible when the compositor advertises zwlr_screencopy_manager_v1
 */
class WaylandPermissionGate : public IPermissionGate {
public:
    bool isCapturePermitted() override;
    void requestPermission() override;
    std::string remediation() const override;
};

} // namespace Capture

#endif // WAYLAND_BACKEND_ENABLED
