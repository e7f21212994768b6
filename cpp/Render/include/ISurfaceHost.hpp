#pragma once
#include <Geometry.hpp>
#include <buffer.hpp>
#include <cstdint>

namespace Render {

/**
 * @brief Destination drawable state, mutated only by PixelExactRenderer on its owning thread
 */
struct RenderSurface {
    // Backing store in device pixels; always the last presented frame's size
    int contentPixelWidth = 0;
    int contentPixelHeight = 0;

    // Scale of the display currently hosting the window
    PixelMath::Scale displayScale;

    // Backing store pixels per logical unit as declared to the toolkit.
    // The surface is native resolution, so this stays 1.
    double contentScale = 1.0;

    PixelMath::LogicalSize windowContentSize;

    // Pixel alignment transform: integer device pixel offset of the frame's
    // top-left corner from the content area's top-left corner (may be negative
    // when the window is smaller than the frame).
    int offsetPixelsX = 0;
    int offsetPixelsY = 0;

    std::uint64_t presentedSequence = 0;
};

/**
 * @brief The mirror window as seen by the renderer
 */
class ISurfaceHost {
public:
    virtual ~ISurfaceHost() = default;

    virtual PixelMath::Scale displayScale() const = 0;
    virtual PixelMath::LogicalSize contentSize() const = 0;

    virtual void setContentScale(double scale) = 0;
    virtual void setResizeIncrements(const PixelMath::LogicalSize& increments) = 0;
    virtual void setImplicitAnimationsEnabled(bool enabled) = 0;

    // Blit 1:1 at the surface offset; no filtering of any kind
    virtual void present(const IMGBuffer::Buffer& frame, const RenderSurface& surface) = 0;
    virtual void clear() = 0;
};

} // namespace Render
