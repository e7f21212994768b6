#pragma once
#include "ICaptureProvider.hpp"
#include <map>
#include <memory>
#include <mutex>

struct _XDisplay;

namespace Capture {

/**
 * @brief Capture provider for X11 (works on both X11 and XWayland)
 *
 * Each session runs its own thread and X connection, grabbing the source
 * rect from the root window through the MIT Shared Memory extension at the
 * descriptor's frame rate. That thread is the session's delivery context.
 */
class XShmCaptureProvider : public ICaptureProvider {
public:
    explicit XShmCaptureProvider(int failureBudget = 10);
    ~XShmCaptureProvider() override;

    std::string name() const override { return "X11/MIT-SHM"; }

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
    _XDisplay* m_display = nullptr; // control thread only: enumeration

    std::mutex m_mutex;
    std::map<ProviderHandle, std::shared_ptr<Stream>> m_streams;
    ProviderHandle m_nextHandle = 1;
};

/**
 * @brief Capture is possible when the X server is reachable and offers MIT-SHM
 */
class X11PermissionGate : public IPermissionGate {
public:
    bool isCapturePermitted() override;
    void requestPermission() override;
    std::string remediation() const override;
};

} // namespace Capture
