#pragma once
#include <Geometry.hpp>
#include <ISurfaceHost.hpp>
#include <functional>
#include <memory>
#include <string>

namespace Selection {
class RegionSelector;
}

namespace Session {

// Full-screen selection overlay; feeds pointer input into its RegionSelector
class IOverlayWindow {
public:
    virtual ~IOverlayWindow() = default;
    virtual void close() = 0;
};

// Frame drawn around the captured region; removed on destruction
class IBorderIndicator {
public:
    virtual ~IBorderIndicator() = default;
    virtual void moveTo(const PixelMath::LogicalRect& globalRegion) = 0;
};

struct MirrorWindowEvents {
    std::function<void(const PixelMath::LogicalSize&)> onResize;
    std::function<void()> onDisplayChanged; // moved to another display or backing scale changed
    std::function<void()> onCloseRequested;
};

class IMirrorWindow : public Render::ISurfaceHost {
public:
    virtual void close() = 0;
};

/**
 * @brief Windowing toolkit as used by the orchestrator
 */
class IWindowToolkit {
public:
    virtual ~IWindowToolkit() = default;

    // Global logical coordinates
    virtual PixelMath::LogicalPoint pointerLocation() const = 0;

    virtual std::unique_ptr<IOverlayWindow> openOverlay(Selection::RegionSelector& selector) = 0;

    virtual std::unique_ptr<IMirrorWindow> openMirrorWindow(const PixelMath::Display& display,
                                                            const PixelMath::LogicalSize& contentSize,
                                                            MirrorWindowEvents events) = 0;

    virtual std::unique_ptr<IBorderIndicator> showBorder(const PixelMath::LogicalRect& globalRegion) = 0;

    // Blocking, modal-style notice
    virtual void showNotice(const std::string& message) = 0;

    // Identifier of this application's windows, used to exclude them from capture
    virtual std::string applicationId() const = 0;
};

} // namespace Session
