#pragma once
#include "ISurfaceHost.hpp"
#include <CaptureTypes.hpp>
#include <FrameMailbox.hpp>
#include <cstdint>
#include <memory>
#include <thread>

namespace Render {

/**
 * @brief Presents mailbox frames onto a native-resolution surface without resampling
 *
 * The backing store always has exactly the frame's device pixel size and a
 * content scale of 1; the frame is placed centered at an integer device pixel
 * offset. Every method must run on the thread that constructed the renderer.
 */
class PixelExactRenderer {
public:
    explicit PixelExactRenderer(ISurfaceHost& host);

    PixelExactRenderer(const PixelExactRenderer&) = delete;
    PixelExactRenderer& operator=(const PixelExactRenderer&) = delete;

    void attach(std::shared_ptr<Capture::FrameMailbox> mailbox, const Capture::CaptureDescriptor& descriptor);
    void detach();
    bool isAttached() const { return static_cast<bool>(m_mailbox); }

    /**
     * @brief Presents the newest pending frame, if any
     * @return true if a frame was presented
     */
    bool renderPending();

    void handleResize(const PixelMath::LogicalSize& contentSize);

    // Re-reads the host's display scale; call on every display or backing change
    void handleDisplayChange();

    // Window size in logical units that maps to whole device pixels
    PixelMath::LogicalSize constrainResize(const PixelMath::LogicalSize& proposed) const;

    // Content size showing the frame 1:1
    PixelMath::LogicalSize preferredContentSize() const;

    const RenderSurface& surface() const { return m_surface; }
    std::uint64_t framesPresented() const { return m_framesPresented; }

private:
    void requireOwnerThread(const char* what) const;
    void applyScale(PixelMath::Scale scale);
    void realign();

    ISurfaceHost& m_host;
    std::thread::id m_owner;

    std::shared_ptr<Capture::FrameMailbox> m_mailbox;
    Capture::CaptureDescriptor m_descriptor;
    RenderSurface m_surface;

    std::uint64_t m_framesPresented = 0;
    bool m_mismatchLogged = false;
};

} // namespace Render
