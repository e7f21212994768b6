#include "PixelExactRenderer.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace Render {

namespace {

int floorHalf(int v) {
    return v >= 0 ? v / 2 : -((-v + 1) / 2);
}

} // namespace

PixelExactRenderer::PixelExactRenderer(ISurfaceHost& host)
    : m_host(host), m_owner(std::this_thread::get_id()) {}

void PixelExactRenderer::requireOwnerThread(const char* what) const {
    if (std::this_thread::get_id() != m_owner) {
        throw std::logic_error(std::string("PixelExactRenderer::") + what +
                               " called off the surface's owning thread");
    }
}

void PixelExactRenderer::attach(std::shared_ptr<Capture::FrameMailbox> mailbox,
                                const Capture::CaptureDescriptor& descriptor) {
    requireOwnerThread("attach");
    if (!mailbox) {
        throw std::invalid_argument("PixelExactRenderer::attach requires a mailbox");
    }

    m_mailbox = std::move(mailbox);
    m_descriptor = descriptor;
    m_mismatchLogged = false;

    m_surface = RenderSurface{};
    m_surface.contentPixelWidth = descriptor.destinationWidth;
    m_surface.contentPixelHeight = descriptor.destinationHeight;
    m_surface.windowContentSize = m_host.contentSize();

    // A frame swap is a discrete state change
    m_host.setImplicitAnimationsEnabled(false);
    applyScale(m_host.displayScale());

    std::cout << "[Render] Attached: surface " << m_surface.contentPixelWidth << "x"
              << m_surface.contentPixelHeight << " px at scale " << m_surface.displayScale.x
              << "x" << m_surface.displayScale.y << std::endl;
}

void PixelExactRenderer::detach() {
    requireOwnerThread("detach");
    if (!m_mailbox) {
        return;
    }
    std::cout << "[Render] Detached after " << m_framesPresented << " frames ("
              << m_mailbox->droppedCount() << " superseded before display)" << std::endl;
    m_mailbox.reset();
    m_host.clear();
}

bool PixelExactRenderer::renderPending() {
    requireOwnerThread("renderPending");
    if (!m_mailbox) {
        return false;
    }

    const IMGBuffer::Buffer* frame = m_mailbox->takeLatest();
    if (!frame) {
        return false;
    }
    if (frame->sequence() <= m_surface.presentedSequence) {
        std::cerr << "[Render] Discarding out-of-order frame " << frame->sequence() << std::endl;
        return false;
    }

    const int width = static_cast<int>(frame->width());
    const int height = static_cast<int>(frame->height());

    // The frame's own size is authoritative, whatever the descriptor said
    if (width != m_surface.contentPixelWidth || height != m_surface.contentPixelHeight) {
        if (!m_mismatchLogged &&
            (width != m_descriptor.destinationWidth || height != m_descriptor.destinationHeight)) {
            std::cerr << "[Render] Frame is " << width << "x" << height << " but the session declared "
                      << m_descriptor.destinationWidth << "x" << m_descriptor.destinationHeight
                      << ", resizing surface" << std::endl;
            m_mismatchLogged = true;
        }
        m_surface.contentPixelWidth = width;
        m_surface.contentPixelHeight = height;
        realign();
    }

    m_surface.presentedSequence = frame->sequence();
    m_host.present(*frame, m_surface);
    ++m_framesPresented;
    return true;
}

void PixelExactRenderer::handleResize(const PixelMath::LogicalSize& contentSize) {
    requireOwnerThread("handleResize");
    m_surface.windowContentSize = contentSize;
    realign();
}

void PixelExactRenderer::handleDisplayChange() {
    requireOwnerThread("handleDisplayChange");
    const PixelMath::Scale scale = m_host.displayScale();
    if (scale.x != m_surface.displayScale.x || scale.y != m_surface.displayScale.y) {
        std::cout << "[Render] Display scale changed " << m_surface.displayScale.x << "x"
                  << m_surface.displayScale.y << " -> " << scale.x << "x" << scale.y << std::endl;
    }
    m_surface.windowContentSize = m_host.contentSize();
    applyScale(scale);
}

PixelMath::LogicalSize PixelExactRenderer::constrainResize(const PixelMath::LogicalSize& proposed) const {
    const PixelMath::Scale scale = m_surface.displayScale;
    PixelMath::LogicalSize constrained;
    constrained.width = std::max(1.0, std::round(proposed.width * scale.x)) / scale.x;
    constrained.height = std::max(1.0, std::round(proposed.height * scale.y)) / scale.y;
    return constrained;
}

PixelMath::LogicalSize PixelExactRenderer::preferredContentSize() const {
    return PixelMath::LogicalSize{m_surface.contentPixelWidth / m_surface.displayScale.x,
                                  m_surface.contentPixelHeight / m_surface.displayScale.y};
}

void PixelExactRenderer::applyScale(PixelMath::Scale scale) {
    if (scale.x <= 0.0 || scale.y <= 0.0) {
        std::cerr << "[Render] Ignoring non-positive display scale" << std::endl;
        return;
    }
    m_surface.displayScale = scale;

    // Backing store is already device pixels; any other content scale would resample it
    m_surface.contentScale = 1.0;
    m_host.setContentScale(1.0);
    m_host.setResizeIncrements(PixelMath::LogicalSize{1.0 / scale.x, 1.0 / scale.y});
    realign();
}

void PixelExactRenderer::realign() {
    const PixelMath::Scale scale = m_surface.displayScale;
    const int windowPixelsX = static_cast<int>(std::lround(m_surface.windowContentSize.width * scale.x));
    const int windowPixelsY = static_cast<int>(std::lround(m_surface.windowContentSize.height * scale.y));

    // (window - frame / scale) / 2, expressed in whole device pixels
    m_surface.offsetPixelsX = floorHalf(windowPixelsX - m_surface.contentPixelWidth);
    m_surface.offsetPixelsY = floorHalf(windowPixelsY - m_surface.contentPixelHeight);
}

} // namespace Render
