#pragma once
#include "CaptureTypes.hpp"
#include <functional>
#include <future>
#include <set>
#include <string>
#include <vector>

namespace Capture {

class ICaptureProvider {
public:
    using FrameCallback = std::function<void(const IMGBuffer::FrameView&)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    virtual ~ICaptureProvider() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Lists the displays the provider can capture right now
     *
     * Never cached by callers; the display set can change between calls.
     */
    virtual std::vector<PixelMath::Display> enumerateDisplays() = 0;

    /**
     * @brief Starts streaming the descriptor's source rect of a display
     * @param exclusions Application identifiers whose windows must not appear
     * @param onFrame Invoked on the provider's delivery thread, in order
     * @param onError Invoked at most once per session for runtime failures
     * @return Completes with the session handle, or holds the start failure
     */
    virtual std::future<ProviderHandle> startSession(const PixelMath::Display& display,
                                                     const CaptureDescriptor& descriptor,
                                                     const std::set<std::string>& exclusions,
                                                     FrameCallback onFrame,
                                                     ErrorCallback onError) = 0;

    /**
     * @brief Stops a session; no callback of that session runs after completion
     */
    virtual std::future<void> stopSession(ProviderHandle handle) = 0;
};

class IPermissionGate {
public:
    virtual ~IPermissionGate() = default;

    virtual bool isCapturePermitted() = 0;
    virtual void requestPermission() = 0;

    // Human readable remediation shown with PermissionDenied / start failures
    virtual std::string remediation() const = 0;
};

} // namespace Capture
